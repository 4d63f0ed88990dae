#include "photolens/config.hpp"
#include "photolens/core/log.hpp"
#include "photolens/core/platform_utils.hpp"

#include <charconv>
#include <limits>

namespace photolens {

namespace {

auto invalid(const char* var, const std::string& value) -> core::error {
  return core::error{core::error_code::config_invalid,
                     std::string("malformed ") + var + "=\"" + value + "\"", "config"};
}

template <typename T>
auto parse_unsigned(const char* var, const std::string& v) -> std::expected<T, core::error> {
  unsigned long long tmp = 0;
  const char* beg = v.data();
  const char* end = beg + v.size();
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || tmp > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    return std::unexpected(invalid(var, v));
  }
  return static_cast<T>(tmp);
}

auto parse_bool(const char* var, const std::string& v) -> std::expected<bool, core::error> {
  if (core::env_truthy(v)) return true;
  if (core::env_falsy(v)) return false;
  return std::unexpected(invalid(var, v));
}

} // namespace

auto load_config_from_env(config base) -> std::expected<config, core::error> {
  config cfg = std::move(base);
  using core::env_nonempty;

  if (auto v = env_nonempty("PHOTOLENS_MODEL")) cfg.model = *v;
  if (auto v = core::safe_getenv("PHOTOLENS_EMBED_MODEL"); v) cfg.embedding_model = *v;
  if (auto v = env_nonempty("PHOTOLENS_ENDPOINT")) cfg.endpoint = *v;
  if (auto v = env_nonempty("PHOTOLENS_DB")) cfg.store_dir = *v;
  if (auto v = env_nonempty("PHOTOLENS_METRIC")) cfg.metric = *v;
  if (auto v = env_nonempty("PHOTOLENS_PROMPT")) cfg.default_prompt = *v;
  if (auto v = env_nonempty("PHOTOLENS_LOG_LEVEL")) cfg.log_level = *v;

  if (auto v = env_nonempty("PHOTOLENS_TIMEOUT_MS")) {
    // Bounded by long, the type CURLOPT_TIMEOUT_MS takes.
    auto ms = parse_unsigned<long>("PHOTOLENS_TIMEOUT_MS", *v);
    if (!ms) return std::unexpected(ms.error());
    cfg.request_timeout = std::chrono::milliseconds(*ms);
  }
  if (auto v = env_nonempty("PHOTOLENS_WORKERS")) {
    auto n = parse_unsigned<std::size_t>("PHOTOLENS_WORKERS", *v);
    if (!n) return std::unexpected(n.error());
    cfg.pool_size = *n;
  }
  if (auto v = env_nonempty("PHOTOLENS_MAX_EDGE")) {
    auto n = parse_unsigned<std::uint32_t>("PHOTOLENS_MAX_EDGE", *v);
    if (!n) return std::unexpected(n.error());
    cfg.max_edge = *n;
  }
  if (auto v = env_nonempty("PHOTOLENS_EMBED_DIM")) {
    auto n = parse_unsigned<std::uint32_t>("PHOTOLENS_EMBED_DIM", *v);
    if (!n) return std::unexpected(n.error());
    cfg.embedding_dim = *n;
  }
  if (auto v = env_nonempty("PHOTOLENS_WAL_MAX_BYTES")) {
    auto n = parse_unsigned<std::uint64_t>("PHOTOLENS_WAL_MAX_BYTES", *v);
    if (!n) return std::unexpected(n.error());
    cfg.wal_max_file_bytes = *n;
  }
  if (auto v = env_nonempty("PHOTOLENS_COMPACT_BYTES")) {
    auto n = parse_unsigned<std::uint64_t>("PHOTOLENS_COMPACT_BYTES", *v);
    if (!n) return std::unexpected(n.error());
    cfg.compact_after_bytes = *n;
  }
  if (auto v = env_nonempty("PHOTOLENS_SYNC")) {
    auto b = parse_bool("PHOTOLENS_SYNC", *v);
    if (!b) return std::unexpected(b.error());
    cfg.sync_on_write = *b;
  }
  return cfg;
}

auto validate(const config& cfg) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (cfg.model.empty()) {
    return std::unexpected(error{error_code::config_invalid, "model must not be empty", "config"});
  }
  if (cfg.endpoint.rfind("http://", 0) != 0 && cfg.endpoint.rfind("https://", 0) != 0) {
    return std::unexpected(error{error_code::config_invalid,
                                 "endpoint must be an http(s) URL: \"" + cfg.endpoint + "\"", "config"});
  }
  if (cfg.pool_size == 0) {
    return std::unexpected(error{error_code::config_invalid, "pool_size must be > 0", "config"});
  }
  if (cfg.max_edge == 0) {
    return std::unexpected(error{error_code::config_invalid, "max_edge must be > 0", "config"});
  }
  if (cfg.metric != "l2" && cfg.metric != "cosine" && cfg.metric != "ip") {
    return std::unexpected(error{error_code::config_invalid,
                                 "unknown metric \"" + cfg.metric + "\" (expected l2|cosine|ip)", "config"});
  }
  if (cfg.store_dir.empty()) {
    return std::unexpected(error{error_code::config_invalid, "store_dir must not be empty", "config"});
  }
  if (auto lvl = core::parse_log_level(cfg.log_level); !lvl) {
    return std::unexpected(lvl.error());
  }
  return {};
}

} // namespace photolens
