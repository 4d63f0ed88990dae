#pragma once

/** \file ollama_provider.hpp
 *  \brief embedding_provider over an Ollama-compatible HTTP API.
 *
 * Endpoints
 * - POST /api/generate   {model, prompt, images:[base64], stream:true} -> NDJSON stream;
 *   "response" fragments are concatenated until "done":true, then trimmed
 * - POST /api/embeddings {model, prompt} -> {"embedding":[...]}
 * - GET  /api/tags       -> {"models":[{"name":...}]}
 * HTTP status >= 400 is provider_failed carrying the body's "error" text when present;
 * unparsable or incomplete bodies are provider_malformed.
 */

#include <chrono>
#include <memory>
#include <string>

#include "photolens/config.hpp"
#include "photolens/provider/embedding_provider.hpp"
#include "photolens/provider/http_transport.hpp"

namespace photolens::provider {

struct ollama_options {
  std::string endpoint{kDefaultEndpoint};
  std::string model{kDefaultModel};          /**< vision model used by describe() */
  std::string embedding_model{kDefaultModel};
  std::chrono::milliseconds timeout{120'000};
  std::string default_prompt{kDefaultPrompt};
};

class ollama_provider final : public embedding_provider {
public:
  ollama_provider(ollama_options opts, std::shared_ptr<http_transport> transport);

  /** \brief Options from config; a curl_transport when transport is null. */
  static auto from_config(const config& cfg, std::shared_ptr<http_transport> transport = nullptr)
      -> std::unique_ptr<ollama_provider>;

  auto describe(const image::canonical_image& img, std::string_view prompt)
      -> std::expected<std::string, core::error> override;
  auto embed_text(std::string_view text) -> std::expected<std::vector<float>, core::error> override;
  auto list_models() -> std::expected<std::vector<std::string>, core::error> override;

  auto options() const noexcept -> const ollama_options& { return opts_; }

private:
  auto call(std::string method, std::string_view path, std::string body)
      -> std::expected<std::string, core::error>;

  ollama_options opts_;
  std::shared_ptr<http_transport> transport_;
};

} // namespace photolens::provider
