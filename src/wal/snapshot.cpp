#include "photolens/wal/snapshot.hpp"
#include "photolens/wal/durable_file.hpp"

#include <charconv>
#include <fstream>
#include <string>

namespace photolens::wal {

namespace {
constexpr const char* kSnapshotHeader = "photolens-wal-snapshot v1";
}

auto load_snapshot(const std::filesystem::path& dir)
    -> std::expected<Snapshot, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(dir / kSnapshotFile);
  if (!in.good()) return std::unexpected(error{error_code::not_found, "snapshot open failed", "wal.snapshot"});
  std::string header; std::getline(in, header);
  if (header != kSnapshotHeader) {
    return std::unexpected(error{error_code::data_integrity, "bad snapshot header", "wal.snapshot"});
  }
  std::string line; std::getline(in, line);
  if (line.rfind("last_lsn=", 0) != 0) {
    return std::unexpected(error{error_code::data_integrity, "missing last_lsn", "wal.snapshot"});
  }
  std::uint64_t last = 0;
  const char* beg = line.data() + 9;
  const char* end = line.data() + line.size();
  auto [ptr, ec] = std::from_chars(beg, end, last, 10);
  if (ec != std::errc() || ptr != end || beg == end) {
    return std::unexpected(error{error_code::data_integrity, "malformed last_lsn", "wal.snapshot"});
  }
  return Snapshot{last};
}

auto save_snapshot(const std::filesystem::path& dir, const Snapshot& s)
    -> std::expected<void, core::error> {
  std::string content = kSnapshotHeader;
  content += "\nlast_lsn=";
  content += std::to_string(s.last_lsn);
  content += "\n";
  return write_file_atomic(dir / kSnapshotFile, content, "wal.snapshot");
}

} // namespace photolens::wal
