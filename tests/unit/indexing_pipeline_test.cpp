#include <catch2/catch_all.hpp>

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <photolens/index/aspect_index.hpp>
#include <photolens/pipeline/indexing_pipeline.hpp>
#include <tests/support/fake_provider.hpp>
#include <tests/support/temp_dir.hpp>
#include <tests/support/test_images.hpp>

using namespace photolens;
using namespace photolens::pipeline;
namespace fs = std::filesystem;

namespace {

index::aspect_index mem_index() {
  auto idx = index::aspect_index::open(index::aspect_index_options{});
  REQUIRE(idx.has_value());
  return std::move(*idx);
}

std::string norm(const fs::path& p) { return fs::absolute(p).lexically_normal().string(); }

// Three decodable photos of distinct widths, one corrupt file and one non-image.
void populate(const test_support::temp_dir& dir) {
  test_support::write_test_image(dir / "a.png", 10, 10);
  test_support::write_test_image(dir / "nested/b.JPG", 20, 10);
  test_support::write_test_image(dir / "nested/deeper/c.bmp", 30, 10);
  test_support::write_bytes(dir / "broken.jpeg", "not really a jpeg");
  test_support::write_bytes(dir / "notes.txt", "ignore me");
}

indexing_request request_for(const test_support::temp_dir& dir, std::size_t concurrency = 2) {
  indexing_request req;
  req.root = dir.path();
  req.concurrency = concurrency;
  return req;
}

void write_numbered(const test_support::temp_dir& dir, int n) {
  for (int i = 0; i < n; ++i) test_support::write_test_image(dir / ("p" + std::to_string(i) + ".png"), 8 + i, 8);
}

} // namespace

TEST_CASE("image extensions are matched case-insensitively", "[pipeline]") {
  REQUIRE(is_image_file("x.png"));
  REQUIRE(is_image_file("x.JPG"));
  REQUIRE(is_image_file("dir/x.Jpeg"));
  REQUIRE(is_image_file("x.bmp"));
  REQUIRE(is_image_file("x.webp"));
  REQUIRE_FALSE(is_image_file("x.gif"));
  REQUIRE_FALSE(is_image_file("png"));
  REQUIRE_FALSE(is_image_file("x.png.txt"));
}

TEST_CASE("collect_images walks recursively and returns sorted absolute paths", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  populate(photos);
  auto files = collect_images(photos.path());
  REQUIRE(files.has_value());
  REQUIRE(files->size() == 4);
  REQUIRE(std::is_sorted(files->begin(), files->end()));
  for (const auto& f : *files) REQUIRE(f.is_absolute());
  REQUIRE(std::find(files->begin(), files->end(), fs::path(norm(photos / "a.png"))) != files->end());
}

TEST_CASE("per-item failures are isolated and counted", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  populate(photos);
  auto idx = mem_index();
  test_support::fake_provider provider;
  provider.failing_width = 20;

  std::vector<std::size_t> completed_seen;
  std::size_t total_seen = 0;
  indexing_pipeline p(idx, provider);
  auto report = p.run(request_for(photos), [&](const item_result&, std::size_t completed, std::size_t total) {
    total_seen = total;
    completed_seen.push_back(completed);
  });
  REQUIRE(report.has_value());
  REQUIRE(report->total == 4);
  REQUIRE(report->succeeded == 2);
  REQUIRE(report->failed == 2);
  REQUIRE(report->skipped == 0);
  REQUIRE(report->failures.size() == 2);
  REQUIRE(total_seen == 4);
  REQUIRE(completed_seen == std::vector<std::size_t>{1, 2, 3, 4});

  std::set<core::error_kind> kinds;
  for (const auto& f : report->failures) {
    REQUIRE(f.outcome == item_outcome::failed);
    REQUIRE(f.error.has_value());
    kinds.insert(core::kind_of(*f.error));
  }
  REQUIRE(kinds == std::set<core::error_kind>{core::error_kind::image_read, core::error_kind::provider});

  REQUIRE(idx.size() == 2);
  REQUIRE(idx.contains(norm(photos / "a.png"), kDefaultAspect));
  REQUIRE(idx.contains(norm(photos / "nested/deeper/c.bmp"), kDefaultAspect));
  REQUIRE_FALSE(idx.contains(norm(photos / "nested/b.JPG"), kDefaultAspect));
}

TEST_CASE("stored records carry the generated description and its embedding", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  test_support::write_test_image(photos / "car.png", 12, 8);
  auto idx = mem_index();
  test_support::fake_provider provider;
  provider.set_description(12, "a red car on a street");

  indexing_pipeline p(idx, provider);
  auto report = p.run(request_for(photos));
  REQUIRE(report.has_value());
  REQUIRE(report->succeeded == 1);

  auto rec = idx.get(norm(photos / "car.png"), kDefaultAspect);
  REQUIRE(rec.has_value());
  const std::string expected = std::string(kDefaultPrompt) + " | a red car on a street";
  REQUIRE(rec->description == expected);
  REQUIRE(rec->embedding == test_support::fake_provider::embed(expected));
}

TEST_CASE("skip mode leaves existing keys untouched and re-runs recompute", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  test_support::write_test_image(photos / "a.png", 10, 10);
  test_support::write_test_image(photos / "b.png", 11, 10);
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);

  REQUIRE(p.run(request_for(photos))->succeeded == 2);
  REQUIRE(provider.describe_calls.load() == 2);

  auto req = request_for(photos);
  req.skip_existing = true;
  test_support::write_test_image(photos / "c.png", 12, 10);
  auto skipped = p.run(req);
  REQUIRE(skipped.has_value());
  REQUIRE(skipped->skipped == 2);
  REQUIRE(skipped->succeeded == 1);
  REQUIRE(provider.describe_calls.load() == 3);

  provider.set_description(10, "changed");
  auto again = p.run(request_for(photos));
  REQUIRE(again->succeeded == 3);
  REQUIRE(provider.describe_calls.load() == 6);
  REQUIRE(idx.get(norm(photos / "a.png"), kDefaultAspect)->description ==
          std::string(kDefaultPrompt) + " | changed");
}

TEST_CASE("skip mode is per aspect", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  test_support::write_test_image(photos / "a.png", 10, 10);
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);
  REQUIRE(p.run(request_for(photos))->succeeded == 1);

  auto req = request_for(photos);
  req.aspect = "color";
  req.prompt = "Describe the colors in this image";
  req.skip_existing = true;
  auto r = p.run(req);
  REQUIRE(r.has_value());
  REQUIRE(r->succeeded == 1);
  REQUIRE(r->skipped == 0);

  const auto records = idx.records_for(norm(photos / "a.png"));
  REQUIRE(records.size() == 2);
  REQUIRE(records[0].aspect_name == "color");
  REQUIRE(records[0].description.rfind("Describe the colors in this image | ", 0) == 0);
  REQUIRE(records[1].aspect_name == "default");
}

TEST_CASE("a custom prompt reaches every describe call", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  write_numbered(photos, 4);
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);
  auto req = request_for(photos, 3);
  req.prompt = "What mood does this photo convey?";
  REQUIRE(p.run(req)->succeeded == 4);
  const auto prompts = provider.prompts_seen();
  REQUIRE(prompts.size() == 4);
  for (const auto& pr : prompts) REQUIRE(pr == "What mood does this photo convey?");
}

TEST_CASE("provider concurrency never exceeds the requested bound", "[pipeline][concurrency]") {
  test_support::temp_dir photos("pipe_photos");
  write_numbered(photos, 8);
  auto idx = mem_index();
  test_support::fake_provider provider;
  provider.describe_delay = std::chrono::milliseconds(15);
  indexing_pipeline p(idx, provider);

  REQUIRE(p.run(request_for(photos, 2))->succeeded == 8);
  REQUIRE(provider.max_in_flight.load() <= 2);
  REQUIRE(provider.max_in_flight.load() >= 1);

  provider.max_in_flight = 0;
  REQUIRE(p.run(request_for(photos, 1))->succeeded == 8);
  REQUIRE(provider.max_in_flight.load() == 1);
}

TEST_CASE("a store failure aborts the run and is returned", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  write_numbered(photos, 6);
  test_support::temp_dir db("pipe_db");
  index::aspect_index_options o;
  o.dir = db / "store";
  auto idx = index::aspect_index::open(o);
  REQUIRE(idx.has_value());
  // The journal opens its first file lazily; without a directory every upsert fails.
  fs::remove_all(db / "store");

  test_support::fake_provider provider;
  indexing_pipeline p(*idx, provider);
  auto report = p.run(request_for(photos, 2));
  REQUIRE_FALSE(report.has_value());
  REQUIRE(core::kind_of(report.error()) == core::error_kind::store);
  REQUIRE(idx->size() == 0);
}

TEST_CASE("run-level validation failures", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);

  auto req = request_for(photos);
  req.aspect = "";
  REQUIRE(p.run(req).error().code == core::error_code::validation_failed);

  req = request_for(photos, 0);
  REQUIRE(p.run(req).error().code == core::error_code::validation_failed);

  req = request_for(photos);
  req.root = photos / "missing";
  REQUIRE(p.run(req).error().code == core::error_code::validation_failed);

  test_support::write_bytes(photos / "file.png", "x");
  req.root = photos / "file.png";
  REQUIRE(p.run(req).error().code == core::error_code::validation_failed);
  REQUIRE(provider.describe_calls.load() == 0);
}

TEST_CASE("an empty directory yields an empty report", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);
  int calls = 0;
  auto report = p.run(request_for(photos), [&](const item_result&, std::size_t, std::size_t) { ++calls; });
  REQUIRE(report.has_value());
  REQUIRE(report->total == 0);
  REQUIRE(calls == 0);
}

TEST_CASE("index_one reports skipped, indexed and failed outcomes", "[pipeline]") {
  test_support::temp_dir photos("pipe_photos");
  test_support::write_test_image(photos / "a.png", 10, 10);
  auto idx = mem_index();
  test_support::fake_provider provider;
  indexing_pipeline p(idx, provider);

  auto first = p.index_one(photos / "a.png", "default", std::nullopt, true);
  REQUIRE(first.outcome == item_outcome::indexed);
  REQUIRE(first.photo_path == norm(photos / "a.png"));
  REQUIRE(p.index_one(photos / "a.png", "default", std::nullopt, true).outcome == item_outcome::skipped);

  auto missing = p.index_one(photos / "nope.png", "default", std::nullopt, false);
  REQUIRE(missing.outcome == item_outcome::failed);
  REQUIRE(missing.error->code == core::error_code::image_read);
}
