#include "photolens/wal/io.hpp"
#include "photolens/wal/durable_file.hpp"
#include "photolens/wal/manifest.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace photolens::wal {

WalWriter::~WalWriter() {
  if (out_.is_open()) out_.close();
}

WalWriter::WalWriter(WalWriter&& o) noexcept
  : dir_(std::move(o.dir_)),
    path_(std::move(o.path_)),
    max_file_bytes_(o.max_file_bytes_),
    fsync_on_rotation_(o.fsync_on_rotation_),
    fsync_on_flush_(o.fsync_on_flush_),
    seq_index_(o.seq_index_),
    cur_bytes_(o.cur_bytes_),
    cur_frames_(o.cur_frames_),
    cur_first_lsn_(o.cur_first_lsn_),
    cur_end_lsn_(o.cur_end_lsn_),
    prev_lsn_(o.prev_lsn_),
    have_prev_(o.have_prev_),
    stats_(o.stats_),
    out_(std::move(o.out_)) {}

WalWriter& WalWriter::operator=(WalWriter&& o) noexcept {
  if (this != &o) {
    if (out_.is_open()) out_.close();
    dir_ = std::move(o.dir_);
    path_ = std::move(o.path_);
    max_file_bytes_ = o.max_file_bytes_;
    fsync_on_rotation_ = o.fsync_on_rotation_;
    fsync_on_flush_ = o.fsync_on_flush_;
    seq_index_ = o.seq_index_;
    cur_bytes_ = o.cur_bytes_;
    cur_frames_ = o.cur_frames_;
    cur_first_lsn_ = o.cur_first_lsn_;
    cur_end_lsn_ = o.cur_end_lsn_;
    prev_lsn_ = o.prev_lsn_;
    have_prev_ = o.have_prev_;
    stats_ = o.stats_;
    out_ = std::move(o.out_);
  }
  return *this;
}

auto list_wal_files(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::pair<std::uint64_t, std::filesystem::path>>, core::error> {
  using core::error; using core::error_code;
  std::vector<std::pair<std::uint64_t, std::filesystem::path>> out;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "list failed: " + dir.string(), "wal.io"});
  for (const auto& de : it) {
    if (!de.is_regular_file()) continue;
    std::uint64_t seq = 0;
    if (parse_wal_filename(de.path().filename().string(), &seq)) out.emplace_back(seq, de.path());
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.first < b.first; });
  return out;
}

auto WalWriter::open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error> {
  using core::error; using core::error_code;
  WalWriter w;
  w.dir_ = opts.dir;
  w.max_file_bytes_ = opts.max_file_bytes;
  w.fsync_on_rotation_ = opts.fsync_on_rotation;
  w.fsync_on_flush_ = opts.fsync_on_flush;
  {
    std::error_code ec;
    std::filesystem::create_directories(w.dir_, ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "mkdir failed: " + w.dir_.string(), "wal.io"});
  }
  auto files = list_wal_files(w.dir_);
  if (!files) return std::unexpected(files.error());

  // Reconcile manifest entries for files a previous session never finished.
  Manifest m{};
  if (auto mx = load_manifest(w.dir_); mx) {
    m = std::move(*mx);
  } else if (mx.error().code != error_code::not_found) {
    return std::unexpected(mx.error());
  }
  std::unordered_set<std::string> known;
  for (const auto& e : m.entries) known.insert(e.file);
  for (const auto& [seq, p] : *files) {
    const auto name = p.filename().string();
    if (known.count(name)) continue;
    auto st = recover_scan(p, [](const WalFrame&) -> std::expected<void, core::error> { return {}; });
    if (!st) return std::unexpected(st.error());
    if (st->frames == 0) continue;
    ManifestEntry e{name, seq, st->first_lsn, st->last_lsn, st->frames, st->bytes};
    if (auto r = upsert_manifest_entry(w.dir_, e); !r) return std::unexpected(r.error());
  }

  // Start after the highest existing sequence; open_seq(++seq) happens on first append.
  w.seq_index_ = files->empty() ? 0 : files->back().first;
  return w;
}

auto WalWriter::open_seq(std::uint64_t seq) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  seq_index_ = seq;
  std::ostringstream oss; oss << "wal-" << std::setw(8) << std::setfill('0') << seq << ".log";
  path_ = dir_ / oss.str();
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "open seq failed: " + path_.string(), "wal.io"});
  if (fsync_on_rotation_) fsync_dir_path(dir_);
  cur_bytes_ = cur_frames_ = 0; cur_first_lsn_ = cur_end_lsn_ = 0;
  return {};
}

auto WalWriter::finish_current() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) return {};
  out_.flush();
  const bool ok = out_.good();
  out_.close();
  if (!ok) return std::unexpected(error{error_code::io_failed, "flush failed: " + path_.string(), "wal.io"});
  if (cur_frames_ == 0) {
    std::error_code ec; std::filesystem::remove(path_, ec);
    return {};
  }
  if (fsync_on_rotation_) {
    if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
    stats_.syncs++;
  }
  ManifestEntry e{path_.filename().string(), seq_index_, cur_first_lsn_, cur_end_lsn_, cur_frames_, cur_bytes_};
  if (auto r = upsert_manifest_entry(dir_, e); !r) return std::unexpected(r.error());
  stats_.rotations++;
  return {};
}

auto WalWriter::append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (dir_.empty()) {
    return std::unexpected(error{error_code::precondition_failed, "writer not open", "wal.io"});
  }
  if (have_prev_ && lsn <= prev_lsn_) {
    return std::unexpected(error{error_code::precondition_failed, "non-monotonic LSN", "wal.io"});
  }
  auto enc = encode_frame(lsn, type, payload);
  if (!enc) return std::unexpected(enc.error());
  const auto& bytes = *enc;

  if (out_.is_open() && max_file_bytes_ > 0 && cur_frames_ > 0 &&
      cur_bytes_ + bytes.size() > max_file_bytes_) {
    if (auto r = finish_current(); !r) return std::unexpected(r.error());
  }
  if (!out_.is_open()) {
    if (auto r = open_seq(seq_index_ + 1); !r) return std::unexpected(r.error());
  }
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "write failed", "wal.io"});
  cur_bytes_ += bytes.size();
  cur_frames_ += 1; stats_.frames++;
  if (cur_first_lsn_ == 0) cur_first_lsn_ = lsn;
  cur_end_lsn_ = lsn;
  prev_lsn_ = lsn; have_prev_ = true;
  return {};
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) return {};
  out_.flush(); stats_.flushes++;
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "flush failed", "wal.io"});
  if (sync || fsync_on_flush_) {
    if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
    stats_.syncs++;
  }
  return {};
}

auto WalWriter::rotate() -> std::expected<void, core::error> {
  return finish_current();
}

auto WalWriter::close() -> std::expected<void, core::error> {
  return finish_current();
}

namespace {
auto read_exact(std::ifstream& in, std::vector<std::uint8_t>& buf, std::size_t n) -> std::size_t {
  buf.resize(n);
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount());
}
}

auto recover_scan(const std::filesystem::path& p, const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  using core::error; using core::error_code;
  RecoveryStats stats{};
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "open failed: " + p.string(), "wal.io"});
  std::error_code fec;
  const std::uint64_t file_sz = std::filesystem::file_size(p, fec);
  if (fec) return std::unexpected(error{error_code::io_failed, "stat failed: " + p.string(), "wal.io"});

  std::uint64_t valid = 0;
  std::vector<std::uint8_t> frame;
  std::vector<std::uint8_t> rest;
  while (valid < file_sz) {
    if (read_exact(in, frame, WAL_HEADER_SIZE) != WAL_HEADER_SIZE) break;
    std::uint32_t magic; std::memcpy(&magic, frame.data(), 4);
    if (magic != WAL_MAGIC) break;
    std::uint32_t len; std::memcpy(&len, frame.data() + 4, 4);
    if (len < WAL_HEADER_SIZE + 4 || len > MAX_FRAME_LEN) break;
    if (static_cast<std::uint64_t>(len) > file_sz - valid) break;

    const std::size_t rest_len = len - WAL_HEADER_SIZE;
    if (read_exact(in, rest, rest_len) != rest_len) break;
    frame.insert(frame.end(), rest.begin(), rest.end());

    auto dec = decode_frame(frame);
    if (!dec) break;

    if (stats.frames == 0) stats.first_lsn = dec->lsn;
    stats.frames += 1;
    stats.bytes += frame.size();
    stats.last_lsn = dec->lsn;
    valid += frame.size();

    if (auto r = on_frame(*dec); !r) return std::unexpected(r.error());
  }
  if (valid < file_sz) {
    stats.torn_tail = true;
    stats.tail_file = p;
    stats.tail_valid_bytes = valid;
  }
  return stats;
}

auto recover_scan_dir(const std::filesystem::path& dir, std::uint64_t cutoff_lsn,
                      const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  using core::error; using core::error_code;
  RecoveryStats agg{};
  auto files = list_wal_files(dir);
  if (!files) return std::unexpected(files.error());

  for (std::size_t i = 0; i < files->size(); ++i) {
    const auto& path = (*files)[i].second;
    std::size_t delivered = 0, skipped = 0, delivered_bytes = 0;
    auto st = recover_scan(path, [&](const WalFrame& f) -> std::expected<void, core::error> {
      if (f.lsn <= cutoff_lsn) { ++skipped; return {}; }
      if (agg.first_lsn == 0) agg.first_lsn = f.lsn;
      ++delivered; delivered_bytes += f.len;
      return on_frame(f);
    });
    if (!st) return std::unexpected(st.error());
    agg.files += 1;
    agg.frames += delivered;
    agg.bytes += delivered_bytes;
    agg.skipped += skipped;
    if (st->last_lsn > agg.last_lsn) agg.last_lsn = st->last_lsn;
    if (st->torn_tail) {
      if (i + 1 < files->size()) {
        return std::unexpected(error{error_code::data_integrity,
                                     "torn middle file: " + path.filename().string(), "wal.io"});
      }
      agg.torn_tail = true;
      agg.tail_file = st->tail_file;
      agg.tail_valid_bytes = st->tail_valid_bytes;
    }
  }
  return agg;
}

} // namespace photolens::wal
