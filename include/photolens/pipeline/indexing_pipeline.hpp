#pragma once

/** \file indexing_pipeline.hpp
 *  \brief Batch indexing of a photo directory under one aspect.
 *
 * Per file: image::normalize_file -> provider.describe_and_embed -> index.upsert.
 * Image and provider failures are isolated per item and counted; a store failure
 * aborts the run (tasks not yet started are abandoned) and is returned.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "photolens/config.hpp"
#include "photolens/error.hpp"
#include "photolens/index/aspect_index.hpp"
#include "photolens/provider/embedding_provider.hpp"

namespace photolens::pipeline {

struct indexing_request {
  std::filesystem::path root;
  std::string aspect{kDefaultAspect};
  std::optional<std::string> prompt;   /**< unset = provider default prompt */
  std::size_t concurrency{4};
  bool skip_existing{false};           /**< skip keys already present (existence only) */
};

enum class item_outcome : std::uint8_t { indexed, skipped, failed };

struct item_result {
  std::string photo_path;
  item_outcome outcome{item_outcome::failed};
  std::optional<core::error> error;    /**< set when outcome == failed */
};

struct indexing_report {
  std::size_t total{};
  std::size_t succeeded{};
  std::size_t skipped{};
  std::size_t failed{};
  std::vector<item_result> failures;   /**< in completion order */
};

/** \brief Invoked on the calling thread as each item completes. */
using progress_callback = std::function<void(const item_result&, std::size_t completed, std::size_t total)>;

/** \brief True for .png .jpg .jpeg .bmp .webp, compared case-insensitively. */
auto is_image_file(const std::filesystem::path& p) -> bool;

/** \brief Absolute, lexically normal form under which a photo is stored.
 *  An empty path stays empty so the index can reject it.
 */
auto photo_key(const std::filesystem::path& photo) -> std::string;

/** \brief Recursively list image files under root as absolute normalized paths, sorted. */
auto collect_images(const std::filesystem::path& root)
    -> std::expected<std::vector<std::filesystem::path>, core::error>;

class indexing_pipeline {
public:
  indexing_pipeline(index::aspect_index& index, provider::embedding_provider& provider,
                    std::uint32_t max_edge = 1024);

  /** \brief Index every image under req.root.
   *
   * Errors (run-level only)
   * - validation_failed: root is not a directory, empty aspect, concurrency == 0
   * - io_failed: directory walk failed
   * - any store error raised by an upsert
   */
  auto run(const indexing_request& req, const progress_callback& progress = {})
      -> std::expected<indexing_report, core::error>;

  /** \brief Index a single file; the result carries per-item failures. */
  auto index_one(const std::filesystem::path& photo, std::string_view aspect,
                 std::optional<std::string_view> prompt, bool skip_existing) -> item_result;

private:
  index::aspect_index& index_;
  provider::embedding_provider& provider_;
  std::uint32_t max_edge_;
};

} // namespace photolens::pipeline
