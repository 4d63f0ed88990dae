#pragma once

/** \file preprocessor.hpp
 *  \brief Normalize raw image bytes into the canonical transport form.
 *
 * Pipeline: decode -> 8-bit depth -> 3-channel colour -> downsize (longer edge <= max_edge,
 * area interpolation, never upscaled) -> PNG -> base64.
 * Pure and deterministic; safe to call concurrently.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

#include "photolens/error.hpp"

namespace photolens::image {

struct preprocess_options {
  std::uint32_t max_edge{1024};
};

struct canonical_image {
  std::string base64_png;  /**< transport-safe PNG bytes */
  int width{};
  int height{};
};

/** \brief Errors: image_read if the bytes are empty or cannot be decoded. */
auto normalize(std::span<const std::uint8_t> raw, const preprocess_options& opts = {})
    -> std::expected<canonical_image, core::error>;

/** \brief Read a file and normalize it. Missing or unreadable files are image_read. */
auto normalize_file(const std::filesystem::path& path, const preprocess_options& opts = {})
    -> std::expected<canonical_image, core::error>;

} // namespace photolens::image
