#pragma once

/** \file config.hpp
 *  \brief Process-wide configuration, built once and passed to every component.
 *
 * Sources, in increasing precedence: compiled defaults, PHOTOLENS_* environment
 * variables (load_config_from_env), command-line overrides applied by the caller.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include "photolens/error.hpp"

namespace photolens {

inline constexpr const char* kDefaultModel = "llava-phi3:latest";
inline constexpr const char* kDefaultEndpoint = "http://localhost:11434";
inline constexpr const char* kDefaultPrompt = "Describe this image in detail:";
inline constexpr const char* kDefaultAspect = "default";

struct config {
  std::string model{kDefaultModel};              /**< generation (vision) model */
  std::string embedding_model;                   /**< text-embedding model; empty = model */
  std::string endpoint{kDefaultEndpoint};        /**< provider base URL */
  std::chrono::milliseconds request_timeout{120'000};
  std::size_t pool_size{4};                      /**< indexing workers */
  std::filesystem::path store_dir{"photolens_db"};
  std::string metric{"l2"};                      /**< l2 | cosine | ip */
  std::string default_prompt{kDefaultPrompt};
  std::uint32_t max_edge{1024};                  /**< preprocessor longer-edge cap */
  std::uint32_t embedding_dim{0};                /**< 0 = fixed by first upsert */
  std::uint64_t wal_max_file_bytes{16ull * 1024ull * 1024ull};
  std::uint64_t compact_after_bytes{64ull * 1024ull * 1024ull}; /**< journal bytes past the checkpoint; 0 = manual */
  bool sync_on_write{false};                     /**< fsync journal after every mutation */
  std::string log_level{"info"};

  /** \brief Model used for text embeddings. */
  [[nodiscard]] auto effective_embedding_model() const -> const std::string& {
    return embedding_model.empty() ? model : embedding_model;
  }
};

/** \brief Overlay PHOTOLENS_* environment variables onto \p base.
 *  Malformed numeric/boolean values yield error_code::config_invalid naming the variable.
 */
auto load_config_from_env(config base = {}) -> std::expected<config, core::error>;

/** \brief Reject configurations no component can run with. */
auto validate(const config& cfg) -> std::expected<void, core::error>;

} // namespace photolens
