#pragma once

/** \file checkpoint.hpp
 *  \brief Full record checkpoint ("records.ckpt") written by compaction.
 *
 * Layout (little-endian):
 *   u32 magic "LPCK" | u32 version=1 | u64 last_lsn | u32 dim | u32 reserved=0 | u64 count
 *   count x { u32 len | record payload (record_codec UPSERT) }
 *   u32 crc32c over every preceding byte
 * Saved atomically (tmp + fsync + rename).
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

#include "photolens/error.hpp"
#include "photolens/index/photo_record.hpp"

namespace photolens::index {

inline constexpr const char* kCheckpointFile = "records.ckpt";
inline constexpr std::uint32_t kCheckpointMagic = 0x4B43504Cu; // "LPCK" on disk
inline constexpr std::uint32_t kCheckpointVersion = 1;

struct checkpoint_image {
  std::uint64_t last_lsn{};
  std::uint32_t dim{};
  std::vector<photo_record> records;
};

/** \brief Load dir/records.ckpt. Absent file is not_found; CRC or layout failures are data_integrity. */
auto load_checkpoint(const std::filesystem::path& dir) -> std::expected<checkpoint_image, core::error>;

auto save_checkpoint(const std::filesystem::path& dir, const checkpoint_image& img)
    -> std::expected<void, core::error>;

} // namespace photolens::index
