#include "photolens/wal/manifest.hpp"
#include "photolens/wal/durable_file.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>

namespace photolens::wal {

namespace {

constexpr const char* kManifestHeader = "photolens-wal-manifest v1";

auto parse_u64(const std::string& s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto parse_error(std::size_t line_no, const std::string& what) -> core::error {
  return core::error{core::error_code::data_integrity,
                     "manifest parse error at line " + std::to_string(line_no) + ": " + what,
                     "wal.manifest"};
}

} // namespace

auto parse_wal_filename(const std::string& name, std::uint64_t* seq) -> bool {
  static const std::regex rx("^wal-([0-9]{8})\\.log$");
  std::smatch m;
  if (!std::regex_match(name, m, rx)) return false;
  std::uint64_t v = 0;
  if (!parse_u64(m[1].str(), v)) return false;
  if (seq) *seq = v;
  return true;
}

auto load_manifest(const std::filesystem::path& dir)
    -> std::expected<Manifest, core::error> {
  using core::error; using core::error_code;
  Manifest m{};
  std::ifstream in(dir / kManifestFile);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "manifest open failed", "wal.manifest"});
  }
  std::string header; std::getline(in, header);
  if (header != kManifestHeader) {
    return std::unexpected(error{error_code::data_integrity, "bad manifest header", "wal.manifest"});
  }

  std::string line; std::size_t line_no = 1; // header already consumed
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    ManifestEntry e{};
    bool have_file = false, have_seq = false, have_first = false, have_end = false,
         have_frames = false, have_bytes = false;

    std::istringstream iss(line);
    std::string kv;
    while (iss >> kv) {
      auto eq = kv.find('='); if (eq == std::string::npos) continue;
      auto k = kv.substr(0, eq);
      auto v = kv.substr(eq + 1);
      if (k == "file") {
        if (!parse_wal_filename(v, nullptr)) return std::unexpected(parse_error(line_no, "invalid filename"));
        e.file = v; have_file = true;
      } else if (k == "seq") {
        if (!(have_seq = parse_u64(v, e.seq))) return std::unexpected(parse_error(line_no, "invalid seq=\"" + v + "\""));
      } else if (k == "first_lsn") {
        if (!(have_first = parse_u64(v, e.first_lsn))) return std::unexpected(parse_error(line_no, "invalid first_lsn=\"" + v + "\""));
      } else if (k == "end_lsn") {
        if (!(have_end = parse_u64(v, e.end_lsn))) return std::unexpected(parse_error(line_no, "invalid end_lsn=\"" + v + "\""));
      } else if (k == "frames") {
        if (!(have_frames = parse_u64(v, e.frames))) return std::unexpected(parse_error(line_no, "invalid frames=\"" + v + "\""));
      } else if (k == "bytes") {
        if (!(have_bytes = parse_u64(v, e.bytes))) return std::unexpected(parse_error(line_no, "invalid bytes=\"" + v + "\""));
      }
    }
    if (!have_file || !have_seq || !have_first || !have_end || !have_frames || !have_bytes) {
      return std::unexpected(parse_error(line_no, "missing required field(s)"));
    }
    m.entries.push_back(std::move(e));
  }
  return m;
}

auto save_manifest(const std::filesystem::path& dir, const Manifest& m)
    -> std::expected<void, core::error> {
  std::string content;
  content.reserve(64 + m.entries.size() * 96);
  content.append(kManifestHeader).append("\n");
  for (const auto& e : m.entries) {
    content.append("file=").append(e.file)
           .append(" seq=").append(std::to_string(e.seq))
           .append(" first_lsn=").append(std::to_string(e.first_lsn))
           .append(" end_lsn=").append(std::to_string(e.end_lsn))
           .append(" frames=").append(std::to_string(e.frames))
           .append(" bytes=").append(std::to_string(e.bytes))
           .append("\n");
  }
  return write_file_atomic(dir / kManifestFile, content, "wal.manifest");
}

auto upsert_manifest_entry(const std::filesystem::path& dir, const ManifestEntry& e)
    -> std::expected<void, core::error> {
  Manifest m{};
  if (auto mx = load_manifest(dir); mx) {
    m = std::move(*mx);
  } else if (mx.error().code != core::error_code::not_found) {
    return std::unexpected(mx.error());
  }
  m.entries.erase(std::remove_if(m.entries.begin(), m.entries.end(), [&](const ManifestEntry& x){
    return x.seq == e.seq || x.file == e.file;
  }), m.entries.end());
  m.entries.push_back(e);
  std::sort(m.entries.begin(), m.entries.end(), [](const ManifestEntry& a, const ManifestEntry& b){ return a.seq < b.seq; });
  return save_manifest(dir, m);
}

} // namespace photolens::wal
