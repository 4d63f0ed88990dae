#pragma once

/** \file entry_id.hpp
 *  \brief Deterministic entry identifiers for (photo_path, aspect_name) keys.
 *
 * entry_id = hex16(fnv1a64(le64(photo_path.size()) + photo_path + aspect_name)).
 * The length prefix makes the hashed byte string injective in the key, so
 * ("ab", "c") and ("a", "bc") differ whatever bytes the names contain. The
 * value is stable across processes and platforms. It is a display id only;
 * the index keys records by the (photo_path, aspect_name) pair itself.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace photolens::index {

[[nodiscard]] constexpr auto fnv1a64(std::string_view bytes,
                                     std::uint64_t h = 14695981039346656037ull) noexcept -> std::uint64_t {
  for (unsigned char c : bytes) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}

[[nodiscard]] constexpr auto entry_hash(std::string_view photo_path, std::string_view aspect_name) noexcept
    -> std::uint64_t {
  std::uint64_t h = 14695981039346656037ull;
  std::uint64_t len = photo_path.size();
  for (int i = 0; i < 8; ++i, len >>= 8) {
    h ^= len & 0xFFu;
    h *= 1099511628211ull;
  }
  h = fnv1a64(photo_path, h);
  return fnv1a64(aspect_name, h);
}

/** \brief 16 lowercase hex digits of entry_hash. */
auto make_entry_id(std::string_view photo_path, std::string_view aspect_name) -> std::string;

} // namespace photolens::index
