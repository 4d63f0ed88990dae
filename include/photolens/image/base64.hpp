#pragma once

/** \file base64.hpp
 *  \brief Standard base64 (RFC 4648 alphabet, '=' padded).
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "photolens/error.hpp"

namespace photolens::image {

auto base64_encode(std::span<const std::uint8_t> bytes) -> std::string;

/** \brief Decode padded base64; whitespace is not accepted. Errors: invalid_argument. */
auto base64_decode(std::string_view text) -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace photolens::image
