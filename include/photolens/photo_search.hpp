#pragma once

/** \file photo_search.hpp
 *  \brief Public operations for front ends: indexing, search and store maintenance.
 *
 * One photo_search owns the aspect index and the embedding provider. Every
 * operation reports failure through std::expected; no exception escapes.
 * Photo paths are stored absolute and lexically normal (pipeline::photo_key);
 * every path argument is normalized the same way before it reaches the index.
 * Thread-safety: all operations may be called concurrently.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "photolens/config.hpp"
#include "photolens/error.hpp"
#include "photolens/index/aspect_index.hpp"
#include "photolens/index/photo_record.hpp"
#include "photolens/pipeline/indexing_pipeline.hpp"
#include "photolens/provider/embedding_provider.hpp"
#include "photolens/query/query_engine.hpp"

namespace photolens {

/** \brief One aspect of a stored photo, without its vector. */
struct aspect_description {
  std::string aspect_name;
  std::string description;
};

class photo_search {
public:
  /** \brief Validate cfg, open the store at cfg.store_dir and attach a provider.
   *  A null provider selects the Ollama provider over libcurl.
   */
  static auto open(const config& cfg, std::unique_ptr<provider::embedding_provider> provider = nullptr)
      -> std::expected<photo_search, core::error>;

  photo_search(photo_search&&) noexcept;
  photo_search& operator=(photo_search&&) noexcept;
  ~photo_search();

  /** \brief Preprocess, describe and embed one photo, then upsert it (always recomputed). */
  auto add_photo(const std::filesystem::path& photo, std::string_view aspect = kDefaultAspect,
                 std::optional<std::string_view> prompt = std::nullopt) -> std::expected<void, core::error>;

  auto upsert(std::string_view photo_path, std::string_view aspect_name, std::span<const float> embedding,
              std::string_view description) -> std::expected<void, core::error>;

  auto remove(std::string_view photo_path, std::optional<std::string_view> aspect_name = std::nullopt)
      -> std::expected<std::size_t, core::error>;

  auto search_by_image(const std::filesystem::path& image, std::optional<std::string_view> aspect_filter = std::nullopt,
                       std::size_t k = query::kDefaultTopK)
      -> std::expected<std::vector<index::search_result>, core::error>;

  auto search_by_image(std::span<const std::uint8_t> image_bytes,
                       std::optional<std::string_view> aspect_filter = std::nullopt,
                       std::size_t k = query::kDefaultTopK)
      -> std::expected<std::vector<index::search_result>, core::error>;

  auto search_by_text(std::string_view text, std::optional<std::string_view> aspect_filter = std::nullopt,
                      std::size_t k = query::kDefaultTopK)
      -> std::expected<std::vector<index::search_result>, core::error>;

  auto search(const query::search_request& req) -> std::expected<std::vector<index::search_result>, core::error>;

  auto list_photo_paths() const -> std::expected<std::vector<std::string>, core::error>;

  /** \brief All aspects and descriptions stored for one photo (empty when unknown). */
  auto describe_photo(std::string_view photo_path) const -> std::expected<std::vector<aspect_description>, core::error>;

  auto clear() -> std::expected<void, core::error>;

  /** \brief Run the indexing pipeline; req.concurrency == 0 selects cfg.pool_size. */
  auto run_indexing(pipeline::indexing_request req, const pipeline::progress_callback& progress = {})
      -> std::expected<pipeline::indexing_report, core::error>;

  auto list_available_models() -> std::expected<std::vector<std::string>, core::error>;

  auto compact() -> std::expected<void, core::error>;

  auto store() noexcept -> index::aspect_index& { return *index_; }
  auto settings() const noexcept -> const config& { return cfg_; }

private:
  photo_search(config cfg, std::unique_ptr<index::aspect_index> index,
               std::unique_ptr<provider::embedding_provider> provider);

  config cfg_;
  std::unique_ptr<index::aspect_index> index_;
  std::unique_ptr<provider::embedding_provider> provider_;
};

} // namespace photolens
