#pragma once

/** \file embedding_provider.hpp
 *  \brief Remote description and embedding generation.
 *
 * Embeddings are always computed from text. describe_and_embed() first asks the
 * vision model for a description of the image, then embeds that description, so
 * image and text queries share one similarity space.
 *
 * Implementations are called concurrently from indexing workers and must be
 * thread-safe. No call is retried implicitly.
 */

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "photolens/error.hpp"
#include "photolens/image/preprocessor.hpp"

namespace photolens::provider {

struct description_embedding {
  std::string description;
  std::vector<float> embedding;
};

class embedding_provider {
public:
  virtual ~embedding_provider() = default;

  /** \brief Generate a description of a canonical image. */
  virtual auto describe(const image::canonical_image& img, std::string_view prompt)
      -> std::expected<std::string, core::error> = 0;

  /** \brief Embed free text. */
  virtual auto embed_text(std::string_view text) -> std::expected<std::vector<float>, core::error> = 0;

  /** \brief Identifiers of the models the endpoint serves. */
  virtual auto list_models() -> std::expected<std::vector<std::string>, core::error> = 0;

  /** \brief describe() with prompt (or the default prompt), then embed_text() of the result.
   *
   * Errors: provider_malformed when either stage returns an empty result; other
   * provider errors propagate unchanged.
   */
  auto describe_and_embed(const image::canonical_image& img, std::optional<std::string_view> prompt = std::nullopt)
      -> std::expected<description_embedding, core::error>;

  auto default_prompt() const noexcept -> const std::string& { return default_prompt_; }

protected:
  explicit embedding_provider(std::string default_prompt) : default_prompt_(std::move(default_prompt)) {}

private:
  std::string default_prompt_;
};

} // namespace photolens::provider
