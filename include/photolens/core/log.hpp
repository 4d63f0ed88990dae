#pragma once

/** \file log.hpp
 *  \brief Named spdlog loggers shared across subsystems.
 *
 * Every subsystem logs through its own named logger ("photolens.index",
 * "photolens.pipeline", ...). All loggers share one stderr sink so output
 * interleaves cleanly across worker threads.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "photolens/error.hpp"

namespace photolens::core {

inline constexpr std::string_view kLogIndex = "photolens.index";
inline constexpr std::string_view kLogWal = "photolens.wal";
inline constexpr std::string_view kLogPipeline = "photolens.pipeline";
inline constexpr std::string_view kLogProvider = "photolens.provider";
inline constexpr std::string_view kLogQuery = "photolens.query";
inline constexpr std::string_view kLogImage = "photolens.image";

/** \brief Fetch (or lazily create) the named logger. Thread-safe. */
auto get_logger(std::string_view name) -> std::shared_ptr<spdlog::logger>;

/** \brief Parse "trace|debug|info|warn|error|critical|off". */
auto parse_log_level(std::string_view s) -> std::expected<spdlog::level::level_enum, error>;

/** \brief Apply a level to every photolens logger, existing and future.
 *  PHOTOLENS_LOG_LEVEL, when set and valid, takes precedence over \p level.
 */
auto set_log_level(spdlog::level::level_enum level) -> void;

} // namespace photolens::core
