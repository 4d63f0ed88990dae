#include "photolens/index/record_codec.hpp"

#include <cstring>

namespace photolens::index {

auto detail::byte_reader::raw(void* dst, std::size_t n) -> bool {
  if (remaining() < n) return false;
  if (n > 0) std::memcpy(dst, bytes_.data() + pos_, n);
  pos_ += n;
  return true;
}

namespace {

void put_str(std::vector<std::uint8_t>& out, const std::string& s) {
  detail::put_u32(out, static_cast<std::uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

auto corrupt(const char* what) -> core::error {
  return core::error{core::error_code::data_integrity, what, "index.codec"};
}

} // namespace

auto encode_mutation(const record_mutation& m) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out;
  out.reserve(4 + 16 + m.photo_path.size() + m.aspect_name.size() + m.description.size() +
              m.embedding.size() * sizeof(float));
  out.push_back(static_cast<std::uint8_t>(m.op));
  out.push_back(0); out.push_back(0); out.push_back(0);
  put_str(out, m.photo_path);
  put_str(out, m.aspect_name);
  put_str(out, m.description);
  detail::put_u32(out, static_cast<std::uint32_t>(m.embedding.size()));
  const auto* fp = reinterpret_cast<const std::uint8_t*>(m.embedding.data());
  out.insert(out.end(), fp, fp + m.embedding.size() * sizeof(float));
  return out;
}

auto decode_mutation(std::span<const std::uint8_t> bytes) -> std::expected<record_mutation, core::error> {
  detail::byte_reader r(bytes);
  record_mutation m;
  std::uint8_t op = 0;
  if (!r.u8(op) || !r.skip(3)) return std::unexpected(corrupt("truncated header"));
  if (op < static_cast<std::uint8_t>(record_op::upsert) || op > static_cast<std::uint8_t>(record_op::clear)) {
    return std::unexpected(corrupt("unknown opcode"));
  }
  m.op = static_cast<record_op>(op);

  std::uint32_t n = 0;
  if (!r.u32(n) || !r.str(m.photo_path, n)) return std::unexpected(corrupt("truncated photo_path"));
  if (!r.u32(n) || !r.str(m.aspect_name, n)) return std::unexpected(corrupt("truncated aspect_name"));
  if (!r.u32(n) || !r.str(m.description, n)) return std::unexpected(corrupt("truncated description"));
  if (!r.u32(n) || !r.floats(m.embedding, n)) return std::unexpected(corrupt("truncated embedding"));
  if (r.remaining() != 0) return std::unexpected(corrupt("trailing bytes"));

  switch (m.op) {
    case record_op::upsert:
      if (m.photo_path.empty() || m.aspect_name.empty() || m.embedding.empty()) {
        return std::unexpected(corrupt("incomplete upsert"));
      }
      break;
    case record_op::delete_key:
      if (m.photo_path.empty() || m.aspect_name.empty()) return std::unexpected(corrupt("incomplete delete"));
      break;
    case record_op::delete_photo:
      if (m.photo_path.empty()) return std::unexpected(corrupt("incomplete delete"));
      break;
    case record_op::clear:
      break;
  }
  return m;
}

} // namespace photolens::index
