#pragma once

/** \file http_transport.hpp
 *  \brief Minimal blocking HTTP seam used by remote providers.
 */

#include <chrono>
#include <expected>
#include <string>

#include "photolens/error.hpp"

namespace photolens::provider {

struct http_request {
  std::string method{"POST"};       /**< "GET" or "POST" */
  std::string url;
  std::string body;                 /**< JSON body for POST */
  std::chrono::milliseconds timeout{120'000};
};

struct http_response {
  long status{};
  std::string body;
};

/** \brief Performs one request per call. Implementations must be callable from many threads.
 *
 * Transport failures map to provider_failed, timeouts to provider_timeout. HTTP error
 * statuses are returned as responses, not errors.
 */
class http_transport {
public:
  virtual ~http_transport() = default;
  virtual auto perform(const http_request& req) -> std::expected<http_response, core::error> = 0;
};

/** \brief libcurl transport; one easy handle per request. */
class curl_transport final : public http_transport {
public:
  curl_transport();
  auto perform(const http_request& req) -> std::expected<http_response, core::error> override;
};

} // namespace photolens::provider
