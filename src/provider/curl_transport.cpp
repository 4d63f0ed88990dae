#include "photolens/provider/http_transport.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>

#include "photolens/core/log.hpp"

namespace photolens::provider {

namespace {

constexpr const char* kComponent = "provider.http";

auto write_body(char* data, std::size_t size, std::size_t nmemb, void* userp) -> std::size_t {
  static_cast<std::string*>(userp)->append(data, size * nmemb);
  return size * nmemb;
}

struct easy_deleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};

struct slist_deleter {
  void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

std::once_flag g_curl_init;

} // namespace

curl_transport::curl_transport() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

auto curl_transport::perform(const http_request& req) -> std::expected<http_response, core::error> {
  using core::error; using core::error_code;
  std::unique_ptr<CURL, easy_deleter> h(curl_easy_init());
  if (!h) return std::unexpected(error{error_code::provider_failed, "curl_easy_init failed", kComponent});

  http_response resp;
  std::unique_ptr<curl_slist, slist_deleter> headers;
  curl_easy_setopt(h.get(), CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &resp.body);
  if (req.method == "POST") {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
  } else {
    curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
  }

  core::get_logger(core::kLogProvider)->debug("{} {} ({} bytes)", req.method, req.url, req.body.size());
  const CURLcode rc = curl_easy_perform(h.get());
  if (rc == CURLE_OPERATION_TIMEDOUT) {
    return std::unexpected(error{error_code::provider_timeout, "request to " + req.url + " timed out", kComponent});
  }
  if (rc != CURLE_OK) {
    return std::unexpected(error{error_code::provider_failed,
                                 req.url + ": " + curl_easy_strerror(rc), kComponent});
  }
  curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  return resp;
}

} // namespace photolens::provider
