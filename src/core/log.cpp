#include "photolens/core/log.hpp"
#include "photolens/core/platform_utils.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace photolens::core {

namespace {

struct registry_state {
  std::mutex mu;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sink;
  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
  std::optional<spdlog::level::level_enum> level;
};

auto state() -> registry_state& {
  static registry_state s;
  return s;
}

auto env_level() -> std::optional<spdlog::level::level_enum> {
  auto v = core::env_nonempty("PHOTOLENS_LOG_LEVEL");
  if (!v) return std::nullopt;
  auto lvl = parse_log_level(*v);
  if (!lvl) return std::nullopt;
  return *lvl;
}

} // namespace

auto get_logger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
  auto& s = state();
  std::lock_guard lock(s.mu);
  auto it = s.loggers.find(std::string(name));
  if (it != s.loggers.end()) return it->second;

  if (!s.sink) {
    s.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  auto logger = std::make_shared<spdlog::logger>(std::string(name), s.sink);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
  if (auto e = env_level()) {
    logger->set_level(*e);
  } else {
    logger->set_level(s.level.value_or(spdlog::level::info));
  }
  s.loggers.emplace(std::string(name), logger);
  return logger;
}

auto parse_log_level(std::string_view s) -> std::expected<spdlog::level::level_enum, error> {
  using spdlog::level::level_enum;
  if (s == "trace") return level_enum::trace;
  if (s == "debug") return level_enum::debug;
  if (s == "info") return level_enum::info;
  if (s == "warn" || s == "warning") return level_enum::warn;
  if (s == "error" || s == "err") return level_enum::err;
  if (s == "critical") return level_enum::critical;
  if (s == "off") return level_enum::off;
  return std::unexpected(error{error_code::config_invalid,
                               "unknown log level '" + std::string(s) + "'", "core.log"});
}

auto set_log_level(spdlog::level::level_enum level) -> void {
  auto& s = state();
  std::lock_guard lock(s.mu);
  const auto effective = env_level().value_or(level);
  s.level = effective;
  for (auto& [name, logger] : s.loggers) {
    logger->set_level(effective);
  }
}

} // namespace photolens::core
