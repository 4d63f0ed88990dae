#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <photolens/wal/io.hpp>
#include <photolens/wal/manifest.hpp>
#include <tests/support/temp_dir.hpp>

using namespace photolens;
namespace fs = std::filesystem;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& s) { return {s.begin(), s.end()}; }

struct collected {
  std::vector<std::uint64_t> lsns;
  std::vector<std::string> payloads;
  wal::FrameCallback callback() {
    return [this](const wal::WalFrame& f) -> std::expected<void, core::error> {
      lsns.push_back(f.lsn);
      payloads.emplace_back(f.payload.begin(), f.payload.end());
      return {};
    };
  }
};

void write_frames(const fs::path& dir, std::uint64_t first, std::uint64_t last, std::uint64_t max_bytes = 0) {
  auto w = wal::WalWriter::open({dir, max_bytes, true, false});
  REQUIRE(w.has_value());
  for (auto lsn = first; lsn <= last; ++lsn) {
    REQUIRE(w->append(lsn, wal::FRAME_RECORD_OP, bytes_of("op-" + std::to_string(lsn))).has_value());
  }
  REQUIRE(w->close().has_value());
}

} // namespace

TEST_CASE("writer creates no file until the first append", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  auto w = wal::WalWriter::open({tmp.path() / "j", 0, true, false});
  REQUIRE(w.has_value());
  REQUIRE(wal::list_wal_files(tmp.path() / "j")->empty());
  REQUIRE(w->flush(true).has_value());
  REQUIRE(w->close().has_value());
  REQUIRE(wal::list_wal_files(tmp.path() / "j")->empty());
}

TEST_CASE("frames are recovered in LSN order across sessions", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  write_frames(tmp.path(), 1, 3);
  write_frames(tmp.path(), 4, 5);

  auto files = wal::list_wal_files(tmp.path());
  REQUIRE(files.has_value());
  REQUIRE(files->size() == 2);
  REQUIRE((*files)[0].first == 1);
  REQUIRE((*files)[1].first == 2);

  collected c;
  auto st = wal::recover_scan_dir(tmp.path(), 0, c.callback());
  REQUIRE(st.has_value());
  REQUIRE(st->frames == 5);
  REQUIRE(st->files == 2);
  REQUIRE(st->first_lsn == 1);
  REQUIRE(st->last_lsn == 5);
  REQUIRE_FALSE(st->torn_tail);
  REQUIRE(c.lsns == std::vector<std::uint64_t>{1, 2, 3, 4, 5});
  REQUIRE(c.payloads.back() == "op-5");
}

TEST_CASE("rotation splits files at max_file_bytes and records them in the manifest", "[wal][io][manifest]") {
  test_support::temp_dir tmp("wal_io");
  // "op-N" frames are 20 + 4 + 4 = 28 bytes; 64 bytes fits two.
  write_frames(tmp.path(), 1, 6, 64);
  auto files = wal::list_wal_files(tmp.path());
  REQUIRE(files->size() == 3);

  auto m = wal::load_manifest(tmp.path());
  REQUIRE(m.has_value());
  REQUIRE(m->entries.size() == 3);
  REQUIRE(m->entries[0].first_lsn == 1);
  REQUIRE(m->entries[0].end_lsn == 2);
  REQUIRE(m->entries[2].end_lsn == 6);
  REQUIRE(m->entries[1].frames == 2);
}

TEST_CASE("cutoff skips covered frames but still reports them in last_lsn", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  write_frames(tmp.path(), 1, 4);
  collected c;
  auto st = wal::recover_scan_dir(tmp.path(), 2, c.callback());
  REQUIRE(st.has_value());
  REQUIRE(c.lsns == std::vector<std::uint64_t>{3, 4});
  REQUIRE(st->skipped == 2);
  REQUIRE(st->last_lsn == 4);
}

TEST_CASE("non-monotonic LSNs are rejected", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  auto w = wal::WalWriter::open({tmp.path(), 0, true, false});
  REQUIRE(w.has_value());
  REQUIRE(w->append(5, wal::FRAME_RECORD_OP, bytes_of("a")).has_value());
  auto r = w->append(5, wal::FRAME_RECORD_OP, bytes_of("b"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::precondition_failed);
}

TEST_CASE("a torn tail is tolerated and its valid prefix reported", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  write_frames(tmp.path(), 1, 3);
  auto files = wal::list_wal_files(tmp.path());
  const auto tail = files->back().second;
  const auto valid = fs::file_size(tail);
  {
    std::ofstream out(tail, std::ios::binary | std::ios::app);
    out.write("\x50\x48\x4F\x4C\x40\x00", 6);
  }
  collected c;
  auto st = wal::recover_scan_dir(tmp.path(), 0, c.callback());
  REQUIRE(st.has_value());
  REQUIRE(st->torn_tail);
  REQUIRE(st->tail_file == tail);
  REQUIRE(st->tail_valid_bytes == valid);
  REQUIRE(c.lsns.size() == 3);
}

TEST_CASE("a torn file followed by a later file is corruption", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  write_frames(tmp.path(), 1, 2);
  {
    auto files = wal::list_wal_files(tmp.path());
    std::ofstream out(files->back().second, std::ios::binary | std::ios::app);
    out.write("junk", 4);
  }
  write_frames(tmp.path(), 3, 4);
  collected c;
  auto st = wal::recover_scan_dir(tmp.path(), 0, c.callback());
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.error().code == core::error_code::data_integrity);
}

TEST_CASE("callback errors abort the scan", "[wal][io]") {
  test_support::temp_dir tmp("wal_io");
  write_frames(tmp.path(), 1, 3);
  int seen = 0;
  auto st = wal::recover_scan_dir(tmp.path(), 0, [&](const wal::WalFrame& f) -> std::expected<void, core::error> {
    ++seen;
    if (f.lsn == 2) return std::unexpected(core::error{core::error_code::data_integrity, "stop", "test"});
    return {};
  });
  REQUIRE_FALSE(st.has_value());
  REQUIRE(st.error().message == "stop");
  REQUIRE(seen == 2);
}

TEST_CASE("files left unfinished by a crashed session are reconciled into the manifest", "[wal][io][manifest]") {
  test_support::temp_dir tmp("wal_io");
  {
    auto w = wal::WalWriter::open({tmp.path(), 0, true, false});
    REQUIRE(w.has_value());
    REQUIRE(w->append(1, wal::FRAME_RECORD_OP, bytes_of("x")).has_value());
    REQUIRE(w->append(2, wal::FRAME_RECORD_OP, bytes_of("y")).has_value());
    REQUIRE(w->flush(false).has_value());
    // destroyed without close(): no manifest entry
  }
  REQUIRE_FALSE(wal::load_manifest(tmp.path()).has_value());

  auto w2 = wal::WalWriter::open({tmp.path(), 0, true, false});
  REQUIRE(w2.has_value());
  auto m = wal::load_manifest(tmp.path());
  REQUIRE(m.has_value());
  REQUIRE(m->entries.size() == 1);
  REQUIRE(m->entries[0].seq == 1);
  REQUIRE(m->entries[0].end_lsn == 2);
  REQUIRE(m->entries[0].frames == 2);

  REQUIRE(w2->append(3, wal::FRAME_RECORD_OP, bytes_of("z")).has_value());
  REQUIRE(w2->index() == 2);
}
