#pragma once

/** \file retention.hpp
 *  \brief Journal retention: purge rotated files already covered by a checkpoint.
 */

#include <cstdint>
#include <expected>
#include <filesystem>

#include "photolens/error.hpp"

namespace photolens::wal {

/** Purge any wal-*.log whose manifest end_lsn <= up_to_lsn, then persist the
 *  trimmed manifest and a snapshot at up_to_lsn so replay starts after it.
 *  Files absent from the manifest are left alone. Returns the number of files removed.
 */
[[nodiscard]] auto purge_wal(const std::filesystem::path& dir, std::uint64_t up_to_lsn)
    -> std::expected<std::size_t, core::error>;

} // namespace photolens::wal
