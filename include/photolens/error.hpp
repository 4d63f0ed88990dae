#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable numeric error codes grouped by thousands for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Codes fold into a coarse error_kind that callers use to decide whether a
 *   failure is per-item (image/provider) or fatal (store/validation).
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace photolens::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  image_read = 1101,
  config_invalid = 2001,
  data_integrity = 3001,
  store_failed = 3101,
  precondition_failed = 4001,
  resource_exhausted = 5001,
  not_found = 6001,
  unavailable = 7001,
  provider_failed = 7101,
  provider_timeout = 7102,
  provider_malformed = 7103,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  validation_failed = 9101,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.aspect" */
};

/** \brief Coarse failure classes. Drive per-item vs fatal handling. */
enum class error_kind : std::uint8_t {
  image_read,   /**< corrupt or unreadable image; per-item */
  provider,     /**< remote model call failed or answered garbage; per-item */
  store,        /**< persistence failure or inconsistency; fatal for the operation */
  validation,   /**< caller supplied bad input; fatal immediately */
  config,       /**< configuration rejected */
  cancelled,
  internal,
};

/** \brief Map an error code onto its kind. */
[[nodiscard]] constexpr auto kind_of(error_code c) noexcept -> error_kind {
  switch (c) {
    case error_code::image_read:
      return error_kind::image_read;
    case error_code::unavailable:
    case error_code::provider_failed:
    case error_code::provider_timeout:
    case error_code::provider_malformed:
      return error_kind::provider;
    case error_code::io_failed:
    case error_code::io_eof:
    case error_code::data_integrity:
    case error_code::store_failed:
    case error_code::not_found:
    case error_code::resource_exhausted:
      return error_kind::store;
    case error_code::precondition_failed:
    case error_code::invalid_argument:
    case error_code::validation_failed:
      return error_kind::validation;
    case error_code::config_invalid:
      return error_kind::config;
    case error_code::cancelled:
      return error_kind::cancelled;
    case error_code::ok:
    case error_code::internal:
      break;
  }
  return error_kind::internal;
}

[[nodiscard]] inline auto kind_of(const error& e) noexcept -> error_kind { return kind_of(e.code); }

[[nodiscard]] constexpr auto to_string(error_kind k) noexcept -> std::string_view {
  switch (k) {
    case error_kind::image_read: return "image_read";
    case error_kind::provider: return "provider";
    case error_kind::store: return "store";
    case error_kind::validation: return "validation";
    case error_kind::config: return "config";
    case error_kind::cancelled: return "cancelled";
    case error_kind::internal: return "internal";
  }
  return "internal";
}

/** \brief "component: message" for logs and CLI output. */
inline auto describe(const error& e) -> std::string {
  if (e.component.empty()) return e.message;
  return e.component + ": " + e.message;
}

} // namespace photolens::core
