#pragma once

/** \file metadata_store.hpp
 *  \brief Record attribute storage and equality filtering with Roaring bitmaps
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "photolens/error.hpp"
#include "photolens/filter_expr.hpp"
#include "roaring.hh"

namespace photolens::metadata {

/** \brief Attributes of one slot (string-valued; equality-filterable). */
struct DocumentMetadata {
    std::uint32_t id{};
    std::unordered_map<std::string, std::string> attributes;
};

/** \brief Metadata store with bitmap filtering
 *
 * Ids are dense 32-bit slots handed out by the owner (the aspect index);
 * Roaring is keyed on 32-bit values.
 *
 * Example usage:
 * ```cpp
 * MetadataStore store;
 * store.add({.id = 7, .attributes = {{"aspect_name", "color"}, {"photo_path", "/a.jpg"}}});
 * auto bm = store.evaluate_filter(aspect_is("color"));   // {7}
 * ```
 */
class MetadataStore {
public:
    MetadataStore();
    ~MetadataStore();

    MetadataStore(MetadataStore&&) noexcept;
    MetadataStore& operator=(MetadataStore&&) noexcept;
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /** \brief Add document metadata; an existing id is replaced.
     *
     * Thread-safety: Thread-safe with concurrent reads
     */
    auto add(const DocumentMetadata& doc) -> void;

    /** \brief Remove document metadata
     *
     * \return not_found if the id is unknown
     */
    auto remove(std::uint32_t id) -> std::expected<void, core::error>;

    /** \brief Evaluate filter expression to bitmap
     *
     * Semantics of empty combinators: and([]) = all, or([]) = none, not([]) = all.
     * Thread-safety: Thread-safe for concurrent calls
     */
    auto evaluate_filter(const filter_expr& expr) const
        -> std::expected<roaring::Roaring, core::error>;

    /** \brief Distinct values of one attribute, sorted. */
    auto values_of(const std::string& field) const -> std::vector<std::string>;

    auto get_all_ids() const -> roaring::Roaring;
    auto size() const -> std::size_t;

    auto clear() -> void;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace photolens::metadata
