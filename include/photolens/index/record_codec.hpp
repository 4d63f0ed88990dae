#pragma once

/** \file record_codec.hpp
 *  \brief Binary encoding of record mutations (journal payloads and checkpoint bodies).
 *
 * Binary schema (little-endian):
 *  uint8 opcode; uint8[3] reserved=0;
 *  uint32 path_len;   bytes photo_path
 *  uint32 aspect_len; bytes aspect_name
 *  uint32 desc_len;   bytes description
 *  uint32 dim;        float32 embedding[dim]
 *  opcode 1 (UPSERT) uses every field; 2 (DELETE_KEY) path+aspect;
 *  3 (DELETE_PHOTO) path only; 4 (CLEAR) none. Unused fields are encoded empty.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "photolens/error.hpp"

namespace photolens::index {

enum class record_op : std::uint8_t { upsert = 1, delete_key = 2, delete_photo = 3, clear = 4 };

struct record_mutation {
  record_op op{record_op::upsert};
  std::string photo_path;
  std::string aspect_name;
  std::string description;
  std::vector<float> embedding;
};

auto encode_mutation(const record_mutation& m) -> std::vector<std::uint8_t>;

/** \brief Decode a payload; truncated, oversized or unknown-opcode input is data_integrity. */
auto decode_mutation(std::span<const std::uint8_t> bytes) -> std::expected<record_mutation, core::error>;

namespace detail {

inline void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
  out.insert(out.end(), p, p + 4);
}

inline void put_u64(std::vector<std::uint8_t>& out, std::uint64_t v) {
  const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
  out.insert(out.end(), p, p + 8);
}

/** Bounds-checked cursor over a byte span. */
class byte_reader {
public:
  explicit byte_reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

  auto u8(std::uint8_t& v) -> bool { return raw(&v, 1); }
  auto u32(std::uint32_t& v) -> bool { return raw(&v, 4); }
  auto u64(std::uint64_t& v) -> bool { return raw(&v, 8); }
  auto skip(std::size_t n) -> bool {
    if (remaining() < n) return false;
    pos_ += n;
    return true;
  }
  auto str(std::string& s, std::size_t n) -> bool {
    if (remaining() < n) return false;
    s.assign(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
    pos_ += n;
    return true;
  }
  auto floats(std::vector<float>& v, std::size_t n) -> bool {
    if (remaining() / sizeof(float) < n) return false;
    v.resize(n);
    return raw(v.data(), n * sizeof(float));
  }
  [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - pos_; }
  [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

private:
  auto raw(void* dst, std::size_t n) -> bool;

  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
};

} // namespace detail

} // namespace photolens::index
