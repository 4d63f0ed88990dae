#include "photolens/pipeline/indexing_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <mutex>
#include <system_error>

#include "photolens/core/log.hpp"
#include "photolens/image/preprocessor.hpp"
#include "photolens/pipeline/result_channel.hpp"
#include "photolens/pipeline/worker_pool.hpp"

namespace photolens::pipeline {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "pipeline.indexing";

auto invalid(std::string msg) -> core::error {
  return core::error{core::error_code::validation_failed, std::move(msg), kComponent};
}

} // namespace

auto is_image_file(const fs::path& p) -> bool {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".webp";
}

auto photo_key(const fs::path& photo) -> std::string {
  if (photo.empty()) return {};
  return fs::absolute(photo).lexically_normal().string();
}

auto collect_images(const fs::path& root) -> std::expected<std::vector<fs::path>, core::error> {
  std::vector<fs::path> out;
  try {
    const auto base = fs::absolute(root).lexically_normal();
    for (const auto& entry : fs::recursive_directory_iterator(base, fs::directory_options::skip_permission_denied)) {
      if (entry.is_regular_file() && is_image_file(entry.path())) out.push_back(entry.path().lexically_normal());
    }
  } catch (const fs::filesystem_error& e) {
    return std::unexpected(core::error{core::error_code::io_failed, e.what(), kComponent});
  }
  std::sort(out.begin(), out.end());
  return out;
}

indexing_pipeline::indexing_pipeline(index::aspect_index& index, provider::embedding_provider& provider,
                                     std::uint32_t max_edge)
    : index_(index), provider_(provider), max_edge_(max_edge) {}

auto indexing_pipeline::index_one(const fs::path& photo, std::string_view aspect,
                                  std::optional<std::string_view> prompt, bool skip_existing) -> item_result {
  item_result r;
  r.photo_path = photo_key(photo);
  if (skip_existing && index_.contains(r.photo_path, aspect)) {
    r.outcome = item_outcome::skipped;
    return r;
  }
  auto fail = [&r](core::error e) {
    r.outcome = item_outcome::failed;
    r.error = std::move(e);
    return r;
  };

  auto img = image::normalize_file(r.photo_path, image::preprocess_options{max_edge_});
  if (!img) return fail(img.error());
  auto de = provider_.describe_and_embed(*img, prompt);
  if (!de) return fail(de.error());
  if (auto up = index_.upsert(r.photo_path, aspect, de->embedding, de->description); !up) return fail(up.error());
  r.outcome = item_outcome::indexed;
  return r;
}

auto indexing_pipeline::run(const indexing_request& req, const progress_callback& progress)
    -> std::expected<indexing_report, core::error> {
  auto log = core::get_logger(core::kLogPipeline);
  if (req.aspect.empty()) return std::unexpected(invalid("empty aspect name"));
  if (req.concurrency == 0) return std::unexpected(invalid("concurrency must be at least 1"));
  std::error_code ec;
  if (!fs::is_directory(req.root, ec)) return std::unexpected(invalid("not a directory: " + req.root.string()));

  auto files = collect_images(req.root);
  if (!files) return std::unexpected(files.error());

  indexing_report report;
  report.total = files->size();
  if (files->empty()) {
    log->info("no images under {}", req.root.string());
    return report;
  }
  log->info("indexing {} images under {} (aspect '{}', {} workers{})", report.total, req.root.string(), req.aspect,
            req.concurrency, req.skip_existing ? ", skipping existing" : "");

  // One message per file; nullopt marks an item abandoned after a store failure.
  result_channel<std::optional<item_result>> results;
  std::atomic<bool> abort{false};
  std::mutex fatal_mu;
  std::optional<core::error> fatal;
  const std::optional<std::string_view> prompt =
      req.prompt ? std::optional<std::string_view>(*req.prompt) : std::nullopt;

  {
    WorkerPool pool(std::min(req.concurrency, files->size()));
    for (const auto& file : *files) {
      pool.submit([&, file] {
        if (abort.load(std::memory_order_acquire)) {
          results.push(std::nullopt);
          return;
        }
        item_result r;
        try {
          r = index_one(file, req.aspect, prompt, req.skip_existing);
        } catch (const std::exception& e) {
          r.photo_path = file.string();
          r.outcome = item_outcome::failed;
          r.error = core::error{core::error_code::internal, e.what(), kComponent};
        }
        if (r.error && core::kind_of(*r.error) == core::error_kind::store) {
          std::lock_guard<std::mutex> lock(fatal_mu);
          if (!fatal) fatal = r.error;
          abort.store(true, std::memory_order_release);
          results.push(std::nullopt);
          return;
        }
        results.push(std::move(r));
      });
    }

    std::size_t completed = 0;
    for (std::size_t i = 0; i < files->size(); ++i) {
      auto msg = results.pop();
      if (!msg) continue;
      ++completed;
      switch (msg->outcome) {
        case item_outcome::indexed: ++report.succeeded; break;
        case item_outcome::skipped: ++report.skipped; break;
        case item_outcome::failed:
          ++report.failed;
          log->warn("failed to index {}: {}", msg->photo_path, core::describe(*msg->error));
          break;
      }
      if (progress) progress(*msg, completed, report.total);
      if (msg->outcome == item_outcome::failed) report.failures.push_back(std::move(*msg));
    }
    pool.wait_all();
  }

  if (fatal) {
    log->error("indexing aborted: {}", core::describe(*fatal));
    return std::unexpected(*fatal);
  }
  log->info("indexed {} of {} photos ({} skipped, {} errors)", report.succeeded, report.total, report.skipped,
            report.failed);
  return report;
}

} // namespace photolens::pipeline
