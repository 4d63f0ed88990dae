#pragma once

/** \file snapshot.hpp
 *  \brief Snapshot (replay cutoff) load/save helpers.
 *
 * Format (v1):
 *   photolens-wal-snapshot v1\n
 *   last_lsn=<u64>\n
 * Frames with lsn <= last_lsn are covered by the record checkpoint and are
 * skipped during recovery. Saved atomically (tmp + fsync + rename).
 */

#include <cstdint>
#include <expected>
#include <filesystem>

#include "photolens/error.hpp"

namespace photolens::wal {

inline constexpr const char* kSnapshotFile = "wal.snapshot";

struct Snapshot { std::uint64_t last_lsn{}; };

auto load_snapshot(const std::filesystem::path& dir)
    -> std::expected<Snapshot, core::error>;

auto save_snapshot(const std::filesystem::path& dir, const Snapshot& s)
    -> std::expected<void, core::error>;

} // namespace photolens::wal
