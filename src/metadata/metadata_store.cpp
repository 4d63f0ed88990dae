/** \file metadata_store.cpp
 *  \brief Implementation of metadata store with Roaring bitmaps
 */

#include "photolens/metadata/metadata_store.hpp"

#include <algorithm>
#include <shared_mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace photolens::metadata {

class MetadataStore::Impl {
public:
    void add(const DocumentMetadata& doc) {
        std::unique_lock lock(mutex_);
        if (documents_.find(doc.id) != documents_.end()) {
            // Treat as update to keep semantics predictable
            remove_locked(doc.id);
        }
        documents_.emplace(doc.id, doc);
        all_ids_.add(doc.id);
        index_document_locked(doc);
    }

    auto remove(std::uint32_t id) -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        if (documents_.find(id) == documents_.end()) {
            return std::unexpected(core::error{
                core::error_code::not_found,
                "Document not found",
                "metadata.remove"
            });
        }
        remove_locked(id);
        return {};
    }

    auto evaluate_filter(const filter_expr& expr) const -> std::expected<roaring::Roaring, core::error> {
        std::shared_lock lock(mutex_);
        return compile_locked(expr);
    }

    auto values_of(const std::string& field) const -> std::vector<std::string> {
        std::shared_lock lock(mutex_);
        std::vector<std::string> out;
        auto fit = tag_index_.find(field);
        if (fit == tag_index_.end()) return out;
        out.reserve(fit->second.size());
        for (const auto& [value, bm] : fit->second) {
            if (!bm.isEmpty()) out.push_back(value);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    auto get_all_ids() const -> roaring::Roaring {
        std::shared_lock lock(mutex_);
        return all_ids_;
    }

    auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return documents_.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        documents_.clear();
        tag_index_.clear();
        all_ids_ = roaring::Roaring();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::uint32_t, DocumentMetadata> documents_;

    // field -> value -> ids
    std::unordered_map<std::string, std::unordered_map<std::string, roaring::Roaring>> tag_index_;
    roaring::Roaring all_ids_{};

    void index_document_locked(const DocumentMetadata& doc) {
        for (const auto& [k, v] : doc.attributes) {
            tag_index_[k][v].add(doc.id);
        }
    }

    void remove_locked(std::uint32_t id) {
        auto it = documents_.find(id);
        if (it == documents_.end()) return;
        for (const auto& [k, v] : it->second.attributes) {
            auto fit = tag_index_.find(k);
            if (fit == tag_index_.end()) continue;
            auto vit = fit->second.find(v);
            if (vit == fit->second.end()) continue;
            vit->second.remove(id);
            if (vit->second.isEmpty()) fit->second.erase(vit);
        }
        documents_.erase(it);
        all_ids_.remove(id);
    }

    auto compile_locked(const filter_expr& expr) const -> std::expected<roaring::Roaring, core::error> {
        return std::visit([this](const auto& node) -> std::expected<roaring::Roaring, core::error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, term>) {
                auto fit = tag_index_.find(node.field);
                if (fit == tag_index_.end()) return roaring::Roaring();
                auto vit = fit->second.find(node.value);
                if (vit == fit->second.end()) return roaring::Roaring();
                return vit->second;
            } else if constexpr (std::is_same_v<T, filter_expr::and_t>) {
                if (node.children.empty()) {
                    // and([]) == true => full set
                    return all_ids_;
                }
                auto acc_e = compile_locked(node.children[0]);
                if (!acc_e) return acc_e;
                auto acc = std::move(*acc_e);
                for (std::size_t i = 1; i < node.children.size(); ++i) {
                    auto rhs_e = compile_locked(node.children[i]);
                    if (!rhs_e) return rhs_e;
                    acc &= *rhs_e;
                }
                return acc;
            } else if constexpr (std::is_same_v<T, filter_expr::or_t>) {
                if (node.children.empty()) {
                    // or([]) == false => empty set
                    return roaring::Roaring();
                }
                auto acc_e = compile_locked(node.children[0]);
                if (!acc_e) return acc_e;
                auto acc = std::move(*acc_e);
                for (std::size_t i = 1; i < node.children.size(); ++i) {
                    auto rhs_e = compile_locked(node.children[i]);
                    if (!rhs_e) return rhs_e;
                    acc |= *rhs_e;
                }
                return acc;
            } else if constexpr (std::is_same_v<T, filter_expr::not_t>) {
                if (node.children.empty()) {
                    return all_ids_;
                }
                if (node.children.size() > 1) {
                    return std::unexpected(core::error{core::error_code::invalid_argument,
                        "not() takes a single child", "metadata.filter"});
                }
                auto child_e = compile_locked(node.children[0]);
                if (!child_e) return child_e;
                auto res = all_ids_;
                res -= *child_e;
                return res;
            }
            return roaring::Roaring();
        }, expr.node);
    }
};

MetadataStore::MetadataStore() : impl_(std::make_unique<Impl>()) {}
MetadataStore::~MetadataStore() = default;
MetadataStore::MetadataStore(MetadataStore&&) noexcept = default;
MetadataStore& MetadataStore::operator=(MetadataStore&&) noexcept = default;

auto MetadataStore::add(const DocumentMetadata& doc) -> void { impl_->add(doc); }
auto MetadataStore::remove(std::uint32_t id) -> std::expected<void, core::error> { return impl_->remove(id); }
auto MetadataStore::evaluate_filter(const filter_expr& expr) const -> std::expected<roaring::Roaring, core::error> { return impl_->evaluate_filter(expr); }
auto MetadataStore::values_of(const std::string& field) const -> std::vector<std::string> { return impl_->values_of(field); }
auto MetadataStore::get_all_ids() const -> roaring::Roaring { return impl_->get_all_ids(); }
auto MetadataStore::size() const -> std::size_t { return impl_->size(); }
void MetadataStore::clear() { impl_->clear(); }

} // namespace photolens::metadata
