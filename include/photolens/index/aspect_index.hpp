#pragma once

/** \file aspect_index.hpp
 *  \brief Persistent (photo_path, aspect_name) -> record mapping with exact similarity ranking.
 *
 * Storage model
 * - Each record lives in one dense 32-bit slot holding path, aspect, description and
 *   embedding together; the slot id is also its key in the metadata bitmap index.
 *   Record, vector and bitmap entry are updated in one exclusive critical section,
 *   so they never disagree.
 * - Mutations are journaled (wal::WalWriter, FRAME_RECORD_OP) before they are applied
 *   in memory; a journal failure leaves the in-memory state untouched.
 * - compact() writes a full checkpoint and purges journal files it covers. With
 *   compact_after_bytes set, a mutation that leaves at least that many journal
 *   bytes past the checkpoint compacts before it returns.
 *
 * Thread-safety
 * - All member functions are safe to call concurrently. Writers take an exclusive
 *   lock; readers share it and observe a point-in-time state.
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
#include "photolens/filter_expr.hpp"
#include "photolens/index/photo_record.hpp"
#include "photolens/kernels/distance.hpp"

namespace photolens::index {

struct aspect_index_options {
  std::filesystem::path dir;        /**< store directory; empty = in-memory, nothing persisted */
  kernels::metric metric{kernels::metric::l2};
  std::uint32_t embedding_dim{0};   /**< 0 = fixed by the first upsert */
  std::uint64_t wal_max_file_bytes{16ull * 1024ull * 1024ull};
  std::uint64_t compact_after_bytes{0};  /**< compact once this much journal follows the checkpoint; 0 = never */
  bool sync_on_write{false};        /**< fsync the journal after every mutation */
};

class aspect_index {
public:
  /** \brief Open (or create) a store, restoring checkpoint and journal state.
   *
   * Errors: io_failed / data_integrity on unreadable or corrupt persisted state,
   * config_invalid when options.embedding_dim disagrees with the stored dimension.
   */
  static auto open(const aspect_index_options& opts) -> std::expected<aspect_index, core::error>;

  /** \brief Open using store_dir, metric, embedding_dim and journal settings from cfg. */
  static auto open(const config& cfg) -> std::expected<aspect_index, core::error>;

  ~aspect_index();
  aspect_index(aspect_index&&) noexcept;
  aspect_index& operator=(aspect_index&&) noexcept;
  aspect_index(const aspect_index&) = delete;
  aspect_index& operator=(const aspect_index&) = delete;

  /** \brief Insert or wholesale-replace the record for (photo_path, aspect_name).
   *
   * Errors
   * - validation_failed: empty path/aspect, empty or non-finite embedding, dimension mismatch
   * - io_failed: journal append failed (record not applied)
   */
  auto upsert(std::string_view photo_path, std::string_view aspect_name,
              std::span<const float> embedding, std::string_view description)
      -> std::expected<void, core::error>;

  /** \brief Up to k records ranked by ascending distance, ties by (photo_path, aspect_name).
   *
   * k == 0 and an empty (or filtered-empty) store give an empty list.
   * Errors: validation_failed for an empty/non-finite query or a dimension mismatch.
   */
  auto query(std::span<const float> embedding, std::size_t k,
             std::optional<std::string_view> aspect_filter = std::nullopt) const
      -> std::expected<std::vector<search_result>, core::error>;

  /** \brief Rank only records matching a filter over aspect_name / photo_path. */
  auto query(std::span<const float> embedding, std::size_t k, const filter_expr& filter) const
      -> std::expected<std::vector<search_result>, core::error>;

  /** \brief Delete one key, or every aspect of photo_path when aspect_name is unset.
   *  \return number of records deleted (0 when nothing matched)
   */
  auto remove(std::string_view photo_path, std::optional<std::string_view> aspect_name = std::nullopt)
      -> std::expected<std::size_t, core::error>;

  /** \brief Delete every record. The dimension is released (unless configured). */
  auto clear() -> std::expected<void, core::error>;

  /** \brief Distinct photo paths, sorted. */
  auto list_photo_paths() const -> std::vector<std::string>;
  /** \brief Distinct aspect names, sorted. */
  auto list_aspects() const -> std::vector<std::string>;

  auto contains(std::string_view photo_path, std::string_view aspect_name) const -> bool;
  auto get(std::string_view photo_path, std::string_view aspect_name) const -> std::optional<photo_record>;
  /** \brief All aspects stored for one photo, ordered by aspect_name. */
  auto records_for(std::string_view photo_path) const -> std::vector<photo_record>;

  auto size() const -> std::size_t;
  /** \brief Store dimensionality; 0 while unset. */
  auto dimension() const -> std::uint32_t;
  auto metric() const noexcept -> kernels::metric;

  /** \brief Push journal buffers to the OS; with sync, also to stable storage. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** \brief Checkpoint all records and purge the journal files covered by it. */
  auto compact() -> std::expected<void, core::error>;

private:
  aspect_index();

  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace photolens::index
