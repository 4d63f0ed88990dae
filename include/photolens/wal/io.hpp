#pragma once

/** \file io.hpp
 *  \brief Journal writer (rotating wal-%08d.log files) and recovery scans.
 *
 * Notes
 * - Writer is not thread-safe; the owner serializes appends.
 * - A writer never appends to a pre-existing file: open() picks the next sequence
 *   number, so files from earlier sessions stay immutable.
 * - The manifest is updated when a file is finished (rotation, rotate(), close())
 *   and reconciled at open for files left behind by a crashed session.
 * - recover_scan* are read-only and reentrant for independent paths.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "photolens/error.hpp"
#include "photolens/wal/frame.hpp"

namespace photolens::wal {

/** \brief Statistics gathered during recovery scan. */
struct RecoveryStats {
  std::size_t frames{};             /**< number of delivered frames */
  std::size_t bytes{};              /**< full frame bytes of delivered frames */
  std::uint64_t first_lsn{};        /**< LSN of the first valid frame (0 if none) */
  std::uint64_t last_lsn{};         /**< LSN of the last valid frame */
  std::size_t skipped{};            /**< valid frames at or below the cutoff */
  std::size_t files{};              /**< files visited (directory scans) */
  bool torn_tail{false};            /**< trailing bytes after the last valid frame */
  std::filesystem::path tail_file;  /**< file holding the torn tail */
  std::uint64_t tail_valid_bytes{}; /**< length of the valid prefix of tail_file */
};

struct WalWriterStats {
  std::uint64_t frames{};
  std::uint64_t rotations{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
};

struct WalWriterOptions {
  std::filesystem::path dir;         /**< directory to place wal-*.log files */
  std::uint64_t max_file_bytes{};    /**< rotate before a frame would exceed this size; 0 disables */
  bool fsync_on_rotation{true};      /**< sync a file when it is finished */
  bool fsync_on_flush{false};        /**< sync on every flush() */
};

using FrameCallback = std::function<std::expected<void, core::error>(const WalFrame&)>;

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept;
  WalWriter& operator=(WalWriter&&) noexcept;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  static auto open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error>;

  /** Append one frame. LSNs must be strictly increasing across the writer's lifetime. */
  auto append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
      -> std::expected<void, core::error>;

  /** Flush buffered data. If sync=true or options.fsync_on_flush, performs an OS-level sync. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Finish the current file (manifest entry + optional sync); the next append opens a new one. */
  auto rotate() -> std::expected<void, core::error>;

  /** Finish the current file and release it. Idempotent. */
  auto close() -> std::expected<void, core::error>;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t index() const noexcept { return seq_index_; }
  const WalWriterStats& stats() const noexcept { return stats_; }

private:
  std::filesystem::path dir_;
  std::filesystem::path path_;
  std::uint64_t max_file_bytes_{};
  bool fsync_on_rotation_{};
  bool fsync_on_flush_{};
  std::uint64_t seq_index_{}; // current (or last finished) file sequence index

  std::uint64_t cur_bytes_{};
  std::uint64_t cur_frames_{};
  std::uint64_t cur_first_lsn_{};
  std::uint64_t cur_end_lsn_{};
  std::uint64_t prev_lsn_{};
  bool have_prev_{false};
  WalWriterStats stats_{};

  std::ofstream out_;

  auto finish_current() -> std::expected<void, core::error>;
  auto open_seq(std::uint64_t seq) -> std::expected<void, core::error>;
};

/** Sequentially scan one journal file and invoke on_frame for each valid frame.
 *  Stops on a torn/truncated tail without error (reported via stats.torn_tail).
 *  An error returned by on_frame aborts the scan and is propagated.
 */
[[nodiscard]] auto recover_scan(const std::filesystem::path& path, const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error>;

/** Scan every wal-*.log in dir in sequence order. Frames with lsn <= cutoff_lsn are
 *  validated but not delivered. A torn file followed by a later file is a
 *  data_integrity error; a torn tail in the last file is tolerated.
 */
[[nodiscard]] auto recover_scan_dir(const std::filesystem::path& dir, std::uint64_t cutoff_lsn,
                                    const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error>;

/** List wal-*.log files in dir ordered by sequence number. */
auto list_wal_files(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::pair<std::uint64_t, std::filesystem::path>>, core::error>;

} // namespace photolens::wal
