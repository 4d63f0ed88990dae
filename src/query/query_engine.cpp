#include "photolens/query/query_engine.hpp"

#include "photolens/core/log.hpp"
#include "photolens/image/preprocessor.hpp"

namespace photolens::query {

namespace {
constexpr const char* kComponent = "query.engine";
}

query_engine::query_engine(const index::aspect_index& index, provider::embedding_provider& provider,
                           std::uint32_t max_edge)
    : index_(index), provider_(provider), max_edge_(max_edge) {}

auto query_engine::rank(const std::vector<float>& embedding, std::optional<std::string_view> aspect_filter,
                        std::size_t k) -> std::expected<std::vector<index::search_result>, core::error> {
  auto hits = index_.query(embedding, k, aspect_filter);
  if (hits) {
    core::get_logger(core::kLogQuery)->debug("query returned {} of k={} (aspect {})", hits->size(), k,
                                             aspect_filter ? std::string(*aspect_filter) : std::string("*"));
  }
  return hits;
}

auto query_engine::search_by_image(std::span<const std::uint8_t> image_bytes,
                                   std::optional<std::string_view> aspect_filter, std::size_t k)
    -> std::expected<std::vector<index::search_result>, core::error> {
  auto img = image::normalize(image_bytes, image::preprocess_options{max_edge_});
  if (!img) return std::unexpected(img.error());
  auto de = provider_.describe_and_embed(*img);
  if (!de) return std::unexpected(de.error());
  return rank(de->embedding, aspect_filter, k);
}

auto query_engine::search_by_image(const std::filesystem::path& image_path,
                                   std::optional<std::string_view> aspect_filter, std::size_t k)
    -> std::expected<std::vector<index::search_result>, core::error> {
  auto img = image::normalize_file(image_path, image::preprocess_options{max_edge_});
  if (!img) return std::unexpected(img.error());
  auto de = provider_.describe_and_embed(*img);
  if (!de) return std::unexpected(de.error());
  return rank(de->embedding, aspect_filter, k);
}

auto query_engine::search_by_text(std::string_view text, std::optional<std::string_view> aspect_filter,
                                  std::size_t k) -> std::expected<std::vector<index::search_result>, core::error> {
  if (text.empty()) {
    return std::unexpected(core::error{core::error_code::validation_failed, "empty query text", kComponent});
  }
  auto embedding = provider_.embed_text(text);
  if (!embedding) return std::unexpected(embedding.error());
  return rank(*embedding, aspect_filter, k);
}

auto query_engine::search(const search_request& req) -> std::expected<std::vector<index::search_result>, core::error> {
  std::optional<std::string_view> filter;
  if (req.aspect_filter) filter = *req.aspect_filter;
  if (req.image_path) return search_by_image(*req.image_path, filter, req.k);
  if (req.text && !req.text->empty()) return search_by_text(*req.text, filter, req.k);
  return std::unexpected(core::error{core::error_code::validation_failed,
                                     "a query needs an image or text", kComponent});
}

} // namespace photolens::query
