#pragma once

/** \file durable_file.hpp
 *  \brief OS-level sync helpers and atomic file replacement.
 *
 * write_file_atomic: write <dst>.tmp, fsync it, rename over dst, then fsync the
 * parent directory (best-effort). On failure the tmp file is removed and an
 * io_failed error is returned; dst is never left half-written.
 */

#include <expected>
#include <filesystem>
#include <string_view>

#include "photolens/error.hpp"

namespace photolens::wal {

auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error>;

// Best-effort: failures to open the directory are not reported.
auto fsync_dir_path(const std::filesystem::path& dir) -> void;

auto write_file_atomic(const std::filesystem::path& dst, std::string_view content, std::string_view component)
    -> std::expected<void, core::error>;

} // namespace photolens::wal
