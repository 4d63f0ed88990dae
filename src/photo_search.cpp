#include "photolens/photo_search.hpp"

#include <exception>

#include "photolens/core/log.hpp"
#include "photolens/provider/ollama_provider.hpp"

namespace photolens {

namespace {

constexpr const char* kComponent = "photo_search";

template<typename T, typename Fn>
auto guarded(Fn&& fn) -> std::expected<T, core::error> {
  try {
    return fn();
  } catch (const std::filesystem::filesystem_error& e) {
    return std::unexpected(core::error{core::error_code::io_failed, e.what(), kComponent});
  } catch (const std::exception& e) {
    return std::unexpected(core::error{core::error_code::internal, e.what(), kComponent});
  }
}

} // namespace

photo_search::photo_search(config cfg, std::unique_ptr<index::aspect_index> index,
                           std::unique_ptr<provider::embedding_provider> provider)
    : cfg_(std::move(cfg)), index_(std::move(index)), provider_(std::move(provider)) {}

photo_search::photo_search(photo_search&&) noexcept = default;
photo_search& photo_search::operator=(photo_search&&) noexcept = default;
photo_search::~photo_search() = default;

auto photo_search::open(const config& cfg, std::unique_ptr<provider::embedding_provider> provider)
    -> std::expected<photo_search, core::error> {
  if (auto v = validate(cfg); !v) return std::unexpected(v.error());
  return guarded<photo_search>([&]() -> std::expected<photo_search, core::error> {
    auto idx = index::aspect_index::open(cfg);
    if (!idx) return std::unexpected(idx.error());
    if (!provider) provider = provider::ollama_provider::from_config(cfg);
    return photo_search(cfg, std::make_unique<index::aspect_index>(std::move(*idx)), std::move(provider));
  });
}

auto photo_search::add_photo(const std::filesystem::path& photo, std::string_view aspect,
                             std::optional<std::string_view> prompt) -> std::expected<void, core::error> {
  return guarded<void>([&]() -> std::expected<void, core::error> {
    pipeline::indexing_pipeline p(*index_, *provider_, cfg_.max_edge);
    auto r = p.index_one(photo, aspect, prompt, /*skip_existing=*/false);
    if (r.outcome == pipeline::item_outcome::failed) return std::unexpected(*r.error);
    return {};
  });
}

auto photo_search::upsert(std::string_view photo_path, std::string_view aspect_name,
                          std::span<const float> embedding, std::string_view description)
    -> std::expected<void, core::error> {
  return guarded<void>([&] {
    return index_->upsert(pipeline::photo_key(photo_path), aspect_name, embedding, description);
  });
}

auto photo_search::remove(std::string_view photo_path, std::optional<std::string_view> aspect_name)
    -> std::expected<std::size_t, core::error> {
  return guarded<std::size_t>([&] { return index_->remove(pipeline::photo_key(photo_path), aspect_name); });
}

auto photo_search::search_by_image(const std::filesystem::path& image, std::optional<std::string_view> aspect_filter,
                                   std::size_t k) -> std::expected<std::vector<index::search_result>, core::error> {
  return guarded<std::vector<index::search_result>>([&] {
    query::query_engine q(*index_, *provider_, cfg_.max_edge);
    return q.search_by_image(image, aspect_filter, k);
  });
}

auto photo_search::search_by_image(std::span<const std::uint8_t> image_bytes,
                                   std::optional<std::string_view> aspect_filter, std::size_t k)
    -> std::expected<std::vector<index::search_result>, core::error> {
  return guarded<std::vector<index::search_result>>([&] {
    query::query_engine q(*index_, *provider_, cfg_.max_edge);
    return q.search_by_image(image_bytes, aspect_filter, k);
  });
}

auto photo_search::search_by_text(std::string_view text, std::optional<std::string_view> aspect_filter,
                                  std::size_t k) -> std::expected<std::vector<index::search_result>, core::error> {
  return guarded<std::vector<index::search_result>>([&] {
    query::query_engine q(*index_, *provider_, cfg_.max_edge);
    return q.search_by_text(text, aspect_filter, k);
  });
}

auto photo_search::search(const query::search_request& req)
    -> std::expected<std::vector<index::search_result>, core::error> {
  return guarded<std::vector<index::search_result>>([&] {
    query::query_engine q(*index_, *provider_, cfg_.max_edge);
    return q.search(req);
  });
}

auto photo_search::list_photo_paths() const -> std::expected<std::vector<std::string>, core::error> {
  return guarded<std::vector<std::string>>(
      [&]() -> std::expected<std::vector<std::string>, core::error> { return index_->list_photo_paths(); });
}

auto photo_search::describe_photo(std::string_view photo_path) const
    -> std::expected<std::vector<aspect_description>, core::error> {
  return guarded<std::vector<aspect_description>>([&]() -> std::expected<std::vector<aspect_description>, core::error> {
    std::vector<aspect_description> out;
    for (auto& rec : index_->records_for(pipeline::photo_key(photo_path))) {
      out.push_back({std::move(rec.aspect_name), std::move(rec.description)});
    }
    return out;
  });
}

auto photo_search::clear() -> std::expected<void, core::error> {
  return guarded<void>([&] { return index_->clear(); });
}

auto photo_search::run_indexing(pipeline::indexing_request req, const pipeline::progress_callback& progress)
    -> std::expected<pipeline::indexing_report, core::error> {
  if (req.concurrency == 0) req.concurrency = cfg_.pool_size;
  return guarded<pipeline::indexing_report>([&]() -> std::expected<pipeline::indexing_report, core::error> {
    pipeline::indexing_pipeline p(*index_, *provider_, cfg_.max_edge);
    auto report = p.run(req, progress);
    if (!report) return report;
    // One fsync per run, whether or not each mutation was synced.
    if (auto f = index_->flush(true); !f) return std::unexpected(f.error());
    return report;
  });
}

auto photo_search::list_available_models() -> std::expected<std::vector<std::string>, core::error> {
  return guarded<std::vector<std::string>>([&] { return provider_->list_models(); });
}

auto photo_search::compact() -> std::expected<void, core::error> {
  return guarded<void>([&] { return index_->compact(); });
}

} // namespace photolens
