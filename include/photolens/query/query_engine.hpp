#pragma once

/** \file query_engine.hpp
 *  \brief Image and text similarity search over the aspect index.
 *
 * Image queries are described and embedded exactly like indexed photos (the
 * description is discarded), so both query kinds rank in the description space.
 * Failures are terminal for the call; there are no partial results.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "photolens/error.hpp"
#include "photolens/index/aspect_index.hpp"
#include "photolens/provider/embedding_provider.hpp"

namespace photolens::query {

inline constexpr std::size_t kDefaultTopK = 5;

struct search_request {
  std::optional<std::filesystem::path> image_path;
  std::optional<std::string> text;
  std::optional<std::string> aspect_filter;
  std::size_t k{kDefaultTopK};
};

class query_engine {
public:
  query_engine(const index::aspect_index& index, provider::embedding_provider& provider,
               std::uint32_t max_edge = 1024);

  auto search_by_image(std::span<const std::uint8_t> image_bytes, std::optional<std::string_view> aspect_filter,
                       std::size_t k) -> std::expected<std::vector<index::search_result>, core::error>;

  auto search_by_image(const std::filesystem::path& image_path, std::optional<std::string_view> aspect_filter,
                       std::size_t k) -> std::expected<std::vector<index::search_result>, core::error>;

  auto search_by_text(std::string_view text, std::optional<std::string_view> aspect_filter, std::size_t k)
      -> std::expected<std::vector<index::search_result>, core::error>;

  /** \brief Dispatch on the request; the image wins when both inputs are present.
   *  Errors: validation_failed when neither an image nor non-empty text is given.
   */
  auto search(const search_request& req) -> std::expected<std::vector<index::search_result>, core::error>;

private:
  auto rank(const std::vector<float>& embedding, std::optional<std::string_view> aspect_filter, std::size_t k)
      -> std::expected<std::vector<index::search_result>, core::error>;

  const index::aspect_index& index_;
  provider::embedding_provider& provider_;
  std::uint32_t max_edge_;
};

} // namespace photolens::query
