#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <photolens/config.hpp>
#include <photolens/index/aspect_index.hpp>
#include <photolens/index/checkpoint.hpp>
#include <photolens/wal/io.hpp>
#include <photolens/wal/snapshot.hpp>
#include <tests/support/temp_dir.hpp>

using namespace photolens;
using namespace photolens::index;
namespace fs = std::filesystem;

namespace {

aspect_index open_at(const fs::path& dir, std::uint32_t dim = 0, std::uint64_t max_bytes = 16ull << 20) {
  aspect_index_options o;
  o.dir = dir;
  o.embedding_dim = dim;
  o.wal_max_file_bytes = max_bytes;
  auto idx = aspect_index::open(o);
  REQUIRE(idx.has_value());
  return std::move(*idx);
}

} // namespace

TEST_CASE("records survive reopen through the journal", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert("/a.jpg", "default", std::vector<float>{1, 0}, "a desc").has_value());
    REQUIRE(idx.upsert("/a.jpg", "color", std::vector<float>{0, 1}, "a color").has_value());
    REQUIRE(idx.upsert("/b.jpg", "default", std::vector<float>{2, 2}, "b desc").has_value());
    REQUIRE(idx.upsert("/b.jpg", "default", std::vector<float>{3, 3}, "b desc 2").has_value());
    REQUIRE(*idx.remove("/a.jpg", std::string_view("color")) == 1);
  }
  auto idx = open_at(tmp.path());
  REQUIRE(idx.size() == 2);
  REQUIRE(idx.dimension() == 2);
  REQUIRE_FALSE(idx.contains("/a.jpg", "color"));
  auto b = idx.get("/b.jpg", "default");
  REQUIRE(b.has_value());
  REQUIRE(b->description == "b desc 2");
  REQUIRE(b->embedding == std::vector<float>{3, 3});

  // New writes after recovery keep appending with fresh LSNs.
  REQUIRE(idx.upsert("/c.jpg", "default", std::vector<float>{5, 5}, "c").has_value());
}

TEST_CASE("keys with embedded control bytes replay as distinct records", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  const std::string p1("/photos/a\x1f" "b.jpg");
  const std::string a2("b.jpg\x1f" "default");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert(p1, "default", std::vector<float>{1, 0}, "one").has_value());
    REQUIRE(idx.upsert("/photos/a", a2, std::vector<float>{0, 1}, "two").has_value());
  }
  auto idx = open_at(tmp.path());
  REQUIRE(idx.size() == 2);
  REQUIRE(idx.get(p1, "default")->description == "one");
  REQUIRE(idx.get("/photos/a", a2)->description == "two");
}

TEST_CASE("clear and photo deletes are replayed", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert("/a.jpg", "default", std::vector<float>{1, 0, 0}, "").has_value());
    REQUIRE(idx.clear().has_value());
    REQUIRE(idx.upsert("/b.jpg", "default", std::vector<float>{1, 0}, "").has_value());
    REQUIRE(idx.upsert("/b.jpg", "mood", std::vector<float>{1, 0}, "").has_value());
    REQUIRE(idx.upsert("/c.jpg", "default", std::vector<float>{1, 0}, "").has_value());
    REQUIRE(*idx.remove("/b.jpg") == 2);
  }
  auto idx = open_at(tmp.path());
  REQUIRE(idx.list_photo_paths() == std::vector<std::string>{"/c.jpg"});
  REQUIRE(idx.dimension() == 2);
}

TEST_CASE("compact checkpoints records and purges covered journal files", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path(), 0, 256);
    for (int i = 0; i < 20; ++i) {
      const std::vector<float> v{static_cast<float>(i), 1};
      REQUIRE(idx.upsert("/p" + std::to_string(i) + ".jpg", "default", v, "photo").has_value());
    }
    REQUIRE(wal::list_wal_files(tmp.path())->size() > 1);
    REQUIRE(idx.compact().has_value());
    REQUIRE(wal::list_wal_files(tmp.path())->empty());
    REQUIRE(fs::exists(tmp.path() / kCheckpointFile));
    REQUIRE(wal::load_snapshot(tmp.path())->last_lsn == 20);

    REQUIRE(*idx.remove("/p0.jpg") == 1);
  }
  auto ck = load_checkpoint(tmp.path());
  REQUIRE(ck.has_value());
  REQUIRE(ck->records.size() == 20);
  REQUIRE(ck->last_lsn == 20);

  auto idx = open_at(tmp.path());
  REQUIRE(idx.size() == 19);
  REQUIRE_FALSE(idx.contains("/p0.jpg", "default"));
  auto hits = idx.query(std::vector<float>{1, 1}, 1);
  REQUIRE(hits->front().photo_path == "/p1.jpg");

  // A second compaction covers the post-checkpoint delete too.
  REQUIRE(idx.compact().has_value());
  auto again = open_at(tmp.path());
  REQUIRE(again.size() == 19);
}

TEST_CASE("journal stays bounded under repeated upserts of one key", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  aspect_index_options o;
  o.dir = tmp.path();
  o.wal_max_file_bytes = 256;
  o.compact_after_bytes = 512;

  auto journal_bytes = [&] {
    std::uintmax_t total = 0;
    for (const auto& f : *wal::list_wal_files(tmp.path())) total += fs::file_size(f.second);
    return total;
  };

  int written = 0;
  for (int session = 0; session < 3; ++session) {
    auto idx = aspect_index::open(o);
    REQUIRE(idx.has_value());
    for (int i = 0; i < 200; ++i, ++written) {
      const std::vector<float> v{static_cast<float>(written), 1};
      REQUIRE(idx->upsert("/same.jpg", "default", v, "pass " + std::to_string(written)).has_value());
      REQUIRE(journal_bytes() < 1024);
    }
    REQUIRE(idx->size() == 1);
  }
  REQUIRE(fs::exists(tmp.path() / kCheckpointFile));
  REQUIRE(wal::list_wal_files(tmp.path())->size() <= 8);

  auto idx = open_at(tmp.path());
  REQUIRE(idx.size() == 1);
  REQUIRE(idx.get("/same.jpg", "default")->description == "pass 599");
}

TEST_CASE("automatic compaction is off by default", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  auto idx = open_at(tmp.path(), 0, 256);
  for (int i = 0; i < 50; ++i) {
    REQUIRE(idx.upsert("/same.jpg", "default", std::vector<float>{1, 1}, "again").has_value());
  }
  REQUIRE_FALSE(fs::exists(tmp.path() / kCheckpointFile));
  REQUIRE(wal::list_wal_files(tmp.path())->size() > 1);
}

TEST_CASE("a torn journal tail is truncated and earlier records kept", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert("/a.jpg", "default", std::vector<float>{1, 0}, "").has_value());
    REQUIRE(idx.upsert("/b.jpg", "default", std::vector<float>{0, 1}, "").has_value());
  }
  auto files = wal::list_wal_files(tmp.path());
  REQUIRE(files->size() == 1);
  const auto tail = files->back().second;
  const auto good_size = fs::file_size(tail);
  {
    std::ofstream out(tail, std::ios::binary | std::ios::app);
    out.write("PHOL\x30\x00\x00", 7);
  }
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.size() == 2);
    REQUIRE(fs::file_size(tail) == good_size);
    REQUIRE(idx.upsert("/c.jpg", "default", std::vector<float>{1, 1}, "").has_value());
  }
  auto idx = open_at(tmp.path());
  REQUIRE(idx.size() == 3);
}

TEST_CASE("a configured dimension that disagrees with the store is a config error", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert("/a.jpg", "default", std::vector<float>{1, 0, 0}, "").has_value());
  }
  aspect_index_options o;
  o.dir = tmp.path();
  o.embedding_dim = 8;
  auto idx = aspect_index::open(o);
  REQUIRE_FALSE(idx.has_value());
  REQUIRE(idx.error().code == core::error_code::config_invalid);
}

TEST_CASE("a corrupt checkpoint fails the open", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  {
    auto idx = open_at(tmp.path());
    REQUIRE(idx.upsert("/a.jpg", "default", std::vector<float>{1, 0}, "").has_value());
    REQUIRE(idx.compact().has_value());
  }
  {
    std::fstream f(tmp.path() / kCheckpointFile, std::ios::binary | std::ios::in | std::ios::out);
    f.seekp(10);
    f.put('\x7f');
  }
  aspect_index_options o;
  o.dir = tmp.path();
  auto idx = aspect_index::open(o);
  REQUIRE_FALSE(idx.has_value());
  REQUIRE(idx.error().code == core::error_code::data_integrity);
}

TEST_CASE("open from config honours metric and store_dir", "[index][persistence]") {
  test_support::temp_dir tmp("idx_persist");
  config cfg;
  cfg.store_dir = tmp.path() / "db";
  cfg.metric = "cosine";
  auto idx = aspect_index::open(cfg);
  REQUIRE(idx.has_value());
  REQUIRE(idx->metric() == kernels::metric::cosine);
  REQUIRE(fs::is_directory(tmp.path() / "db"));

  cfg.metric = "hamming";
  REQUIRE(aspect_index::open(cfg).error().code == core::error_code::config_invalid);
}
