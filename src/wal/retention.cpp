#include "photolens/wal/retention.hpp"
#include "photolens/wal/manifest.hpp"
#include "photolens/wal/snapshot.hpp"

namespace photolens::wal {

auto purge_wal(const std::filesystem::path& dir, std::uint64_t up_to_lsn)
    -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  Manifest m{};
  if (auto mx = load_manifest(dir); mx) {
    m = std::move(*mx);
  } else if (mx.error().code != error_code::not_found) {
    return std::unexpected(mx.error());
  }
  // Snapshot first: if we crash after it, replay skips the covered frames anyway.
  if (auto sp = save_snapshot(dir, Snapshot{up_to_lsn}); !sp) return std::unexpected(sp.error());

  Manifest kept;
  std::size_t removed = 0;
  for (const auto& e : m.entries) {
    if (e.end_lsn <= up_to_lsn) { // inclusive delete at cutoff
      std::error_code ec; std::filesystem::remove(dir / e.file, ec);
      if (ec) return std::unexpected(error{error_code::io_failed, "remove failed: " + e.file, "wal.retention"});
      ++removed;
    } else {
      kept.entries.push_back(e);
    }
  }
  if (auto sx = save_manifest(dir, kept); !sx) return std::unexpected(sx.error());
  return removed;
}

} // namespace photolens::wal
