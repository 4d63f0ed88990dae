#pragma once

/** \file manifest.hpp
 *  \brief Journal manifest format and load/save helpers.
 *
 * Format (v1):
 *   header: "photolens-wal-manifest v1"\n
 *   lines:  file=<name> seq=<N> first_lsn=<u64> end_lsn=<u64> frames=<u64> bytes=<u64>\n
 * Saved atomically (tmp + fsync + rename).
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "photolens/error.hpp"

namespace photolens::wal {

inline constexpr const char* kManifestFile = "wal.manifest";

struct ManifestEntry {
  std::string file;          // filename (relative to dir)
  std::uint64_t seq{};       // sequence number
  std::uint64_t first_lsn{}; // first LSN in file
  std::uint64_t end_lsn{};   // last LSN in file
  std::uint64_t frames{};    // number of frames
  std::uint64_t bytes{};     // total bytes
};

struct Manifest { std::vector<ManifestEntry> entries; };

/** \brief Load dir/wal.manifest; not_found if absent, data_integrity if malformed. */
auto load_manifest(const std::filesystem::path& dir)
    -> std::expected<Manifest, core::error>;

auto save_manifest(const std::filesystem::path& dir, const Manifest& m)
    -> std::expected<void, core::error>;

/** \brief Replace (by seq or file) or insert an entry; keeps entries sorted by seq. */
auto upsert_manifest_entry(const std::filesystem::path& dir, const ManifestEntry& e)
    -> std::expected<void, core::error>;

/** \brief True when name matches "wal-<8 digits>.log"; stores the digits in *seq. */
auto parse_wal_filename(const std::string& name, std::uint64_t* seq) -> bool;

} // namespace photolens::wal
