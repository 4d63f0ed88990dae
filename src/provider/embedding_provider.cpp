#include "photolens/provider/embedding_provider.hpp"

namespace photolens::provider {

auto embedding_provider::describe_and_embed(const image::canonical_image& img,
                                            std::optional<std::string_view> prompt)
    -> std::expected<description_embedding, core::error> {
  using core::error; using core::error_code;
  const std::string_view p = (prompt && !prompt->empty()) ? *prompt : std::string_view(default_prompt_);
  auto description = describe(img, p);
  if (!description) return std::unexpected(description.error());
  if (description->empty()) {
    return std::unexpected(error{error_code::provider_malformed, "empty description", "provider"});
  }
  auto embedding = embed_text(*description);
  if (!embedding) return std::unexpected(embedding.error());
  if (embedding->empty()) {
    return std::unexpected(error{error_code::provider_malformed, "empty embedding", "provider"});
  }
  return description_embedding{std::move(*description), std::move(*embedding)};
}

} // namespace photolens::provider
