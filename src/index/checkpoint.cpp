#include "photolens/index/checkpoint.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "photolens/index/entry_id.hpp"
#include "photolens/index/record_codec.hpp"
#include "photolens/wal/durable_file.hpp"
#include "photolens/wal/frame.hpp"

namespace photolens::index {

namespace {

constexpr std::size_t kHeaderSize = 4 + 4 + 8 + 4 + 4 + 8;

auto corrupt(const char* what) -> core::error {
  return core::error{core::error_code::data_integrity, what, "index.checkpoint"};
}

} // namespace

auto load_checkpoint(const std::filesystem::path& dir) -> std::expected<checkpoint_image, core::error> {
  using core::error; using core::error_code;
  const auto p = dir / kCheckpointFile;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    return std::unexpected(error{error_code::not_found, "no checkpoint", "index.checkpoint"});
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "open checkpoint failed", "index.checkpoint"});
  std::vector<std::uint8_t> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::unexpected(error{error_code::io_failed, "read checkpoint failed", "index.checkpoint"});

  if (buf.size() < kHeaderSize + 4) return std::unexpected(corrupt("checkpoint too short"));
  std::span<const std::uint8_t> all(buf);
  std::uint32_t stored_crc = 0;
  std::memcpy(&stored_crc, buf.data() + buf.size() - 4, 4);
  if (wal::crc32c(all.first(buf.size() - 4)) != stored_crc) return std::unexpected(corrupt("checkpoint crc mismatch"));

  detail::byte_reader r(all.first(buf.size() - 4));
  std::uint32_t magic = 0, version = 0, reserved = 0;
  std::uint64_t count = 0;
  checkpoint_image img;
  r.u32(magic); r.u32(version); r.u64(img.last_lsn); r.u32(img.dim); r.u32(reserved); r.u64(count);
  if (magic != kCheckpointMagic) return std::unexpected(corrupt("bad checkpoint magic"));
  if (version != kCheckpointVersion) return std::unexpected(corrupt("unsupported checkpoint version"));

  img.records.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(count, 1u << 20)));
  for (std::uint64_t i = 0; i < count; ++i) {
    std::uint32_t len = 0;
    if (!r.u32(len) || r.remaining() < len) return std::unexpected(corrupt("truncated checkpoint record"));
    auto m = decode_mutation(all.subspan(r.position(), len));
    if (!m) return std::unexpected(m.error());
    if (m->op != record_op::upsert) return std::unexpected(corrupt("non-upsert checkpoint record"));
    if (m->embedding.size() != img.dim) return std::unexpected(corrupt("checkpoint dimension mismatch"));
    r.skip(len);
    photo_record rec;
    rec.entry_id = make_entry_id(m->photo_path, m->aspect_name);
    rec.photo_path = std::move(m->photo_path);
    rec.aspect_name = std::move(m->aspect_name);
    rec.description = std::move(m->description);
    rec.embedding = std::move(m->embedding);
    img.records.push_back(std::move(rec));
  }
  if (r.remaining() != 0) return std::unexpected(corrupt("trailing checkpoint bytes"));
  return img;
}

auto save_checkpoint(const std::filesystem::path& dir, const checkpoint_image& img)
    -> std::expected<void, core::error> {
  std::vector<std::uint8_t> out;
  detail::put_u32(out, kCheckpointMagic);
  detail::put_u32(out, kCheckpointVersion);
  detail::put_u64(out, img.last_lsn);
  detail::put_u32(out, img.dim);
  detail::put_u32(out, 0);
  detail::put_u64(out, img.records.size());
  for (const auto& rec : img.records) {
    auto payload = encode_mutation(record_mutation{record_op::upsert, rec.photo_path, rec.aspect_name,
                                                   rec.description, rec.embedding});
    detail::put_u32(out, static_cast<std::uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
  }
  detail::put_u32(out, wal::crc32c(out));
  return wal::write_file_atomic(dir / kCheckpointFile,
                                std::string_view(reinterpret_cast<const char*>(out.data()), out.size()),
                                "index.checkpoint");
}

} // namespace photolens::index
