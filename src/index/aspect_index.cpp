#include "photolens/index/aspect_index.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <shared_mutex>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "photolens/core/log.hpp"
#include "photolens/index/checkpoint.hpp"
#include "photolens/index/entry_id.hpp"
#include "photolens/index/record_codec.hpp"
#include "photolens/metadata/metadata_store.hpp"
#include "photolens/wal/frame.hpp"
#include "photolens/wal/io.hpp"
#include "photolens/wal/retention.hpp"
#include "photolens/wal/snapshot.hpp"

namespace photolens::index {

namespace {

constexpr const char* kComponent = "index.aspect";

auto invalid(std::string msg) -> core::error {
  return core::error{core::error_code::validation_failed, std::move(msg), kComponent};
}

auto check_vector(std::span<const float> v, std::uint32_t dim, bool store_empty)
    -> std::expected<void, core::error> {
  if (v.empty()) return std::unexpected(invalid("empty embedding"));
  if (!std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); })) {
    return std::unexpected(invalid("embedding contains non-finite values"));
  }
  if (dim != 0 && v.size() != dim && !store_empty) {
    return std::unexpected(invalid("embedding dimension " + std::to_string(v.size()) +
                                   " does not match store dimension " + std::to_string(dim)));
  }
  return {};
}

// Injective in (path, aspect): the path length fixes the split point.
auto slot_key(std::string_view path, std::string_view aspect) -> std::string {
  std::string k = std::to_string(path.size());
  k.reserve(k.size() + 1 + path.size() + aspect.size());
  k.push_back(':');
  k.append(path);
  k.append(aspect);
  return k;
}

auto by_distance(const search_result& a, const search_result& b) -> bool {
  if (a.distance != b.distance) return a.distance < b.distance;
  if (a.photo_path != b.photo_path) return a.photo_path < b.photo_path;
  return a.aspect_name < b.aspect_name;
}

} // namespace

struct aspect_index::impl {
  aspect_index_options opts;
  std::uint32_t dim{};

  std::vector<std::optional<photo_record>> slots;
  std::vector<std::uint32_t> free_slots;
  std::unordered_map<std::string, std::uint32_t> slot_by_key;
  metadata::MetadataStore meta;

  std::optional<wal::WalWriter> journal;
  std::uint64_t next_lsn{1};
  std::uint64_t journal_bytes{};  // framed bytes written or replayed past the checkpoint

  mutable std::shared_mutex mu;

  ~impl() {
    if (journal) {
      if (auto r = journal->close(); !r) {
        core::get_logger(core::kLogIndex)->warn("journal close failed: {}", core::describe(r.error()));
      }
    }
  }

  auto find_slot(std::string_view path, std::string_view aspect) const -> std::optional<std::uint32_t> {
    auto it = slot_by_key.find(slot_key(path, aspect));
    if (it == slot_by_key.end()) return std::nullopt;
    return it->second;
  }

  auto live() const -> std::size_t { return slot_by_key.size(); }

  auto apply_upsert(record_mutation&& m) -> void {
    auto key = slot_key(m.photo_path, m.aspect_name);
    if (live() == 0) dim = static_cast<std::uint32_t>(m.embedding.size());

    std::uint32_t slot;
    if (auto it = slot_by_key.find(key); it != slot_by_key.end()) {
      slot = it->second;
    } else if (!free_slots.empty()) {
      slot = free_slots.back();
      free_slots.pop_back();
    } else {
      slot = static_cast<std::uint32_t>(slots.size());
      slots.emplace_back();
    }
    meta.add(metadata::DocumentMetadata{slot, {{kFieldPhotoPath, m.photo_path}, {kFieldAspectName, m.aspect_name}}});
    photo_record rec;
    rec.entry_id = make_entry_id(m.photo_path, m.aspect_name);
    rec.photo_path = std::move(m.photo_path);
    rec.aspect_name = std::move(m.aspect_name);
    rec.description = std::move(m.description);
    rec.embedding = std::move(m.embedding);
    slots[slot] = std::move(rec);
    slot_by_key[std::move(key)] = slot;
  }

  auto erase_slot(std::uint32_t slot) -> void {
    const auto& rec = *slots[slot];
    slot_by_key.erase(slot_key(rec.photo_path, rec.aspect_name));
    (void)meta.remove(slot); // present by construction
    slots[slot].reset();
    free_slots.push_back(slot);
  }

  auto apply_remove_photo(std::string_view path) -> std::size_t {
    auto bm = meta.evaluate_filter(photo_is(std::string(path)));
    if (!bm) return 0;
    std::size_t n = 0;
    for (std::uint32_t slot : *bm) {
      erase_slot(slot);
      ++n;
    }
    return n;
  }

  auto apply_clear() -> void {
    slots.clear();
    free_slots.clear();
    slot_by_key.clear();
    meta.clear();
    dim = opts.embedding_dim;
  }

  // Replay path: journal records must satisfy the same invariants as live writes.
  auto apply(record_mutation&& m) -> std::expected<void, core::error> {
    using core::error; using core::error_code;
    switch (m.op) {
      case record_op::upsert:
        if (dim != 0 && live() != 0 && m.embedding.size() != dim) {
          return std::unexpected(error{error_code::data_integrity, "journal dimension mismatch", kComponent});
        }
        apply_upsert(std::move(m));
        return {};
      case record_op::delete_key:
        if (auto slot = find_slot(m.photo_path, m.aspect_name)) erase_slot(*slot);
        return {};
      case record_op::delete_photo:
        (void)apply_remove_photo(m.photo_path);
        return {};
      case record_op::clear:
        apply_clear();
        return {};
    }
    return {};
  }

  // Append only; the caller applies the mutation and then calls journal_flush().
  auto journal_append(const record_mutation& m) -> std::expected<void, core::error> {
    if (!journal) return {};
    const auto payload = encode_mutation(m);
    if (auto r = journal->append(next_lsn, wal::FRAME_RECORD_OP, payload); !r) return r;
    ++next_lsn;
    journal_bytes += wal::WAL_HEADER_SIZE + payload.size() + 4;
    return {};
  }

  auto journal_flush() -> std::expected<void, core::error> {
    if (!journal) return {};
    return journal->flush(opts.sync_on_write);
  }

  auto rank(std::span<const float> q, std::size_t k, const roaring::Roaring& candidates) const
      -> std::vector<search_result> {
    std::vector<search_result> out;
    out.reserve(static_cast<std::size_t>(candidates.cardinality()));
    for (std::uint32_t slot : candidates) {
      const auto& rec = slots[slot];
      if (!rec) continue;
      out.push_back({rec->photo_path, rec->aspect_name, kernels::score(opts.metric, q, rec->embedding),
                     rec->description});
    }
    if (out.size() > k) {
      auto kth = out.begin() + static_cast<std::ptrdiff_t>(k);
      std::nth_element(out.begin(), kth, out.end(), by_distance);
      std::sort(out.begin(), kth, by_distance);
      out.resize(k);
    } else {
      std::sort(out.begin(), out.end(), by_distance);
    }
    return out;
  }

  auto recover() -> std::expected<void, core::error>;
  auto compact_locked() -> std::expected<void, core::error>;

  // Writer lock held; the mutation is already applied and flushed, so a failed
  // compaction leaves it durable in the journal and is retried next time.
  auto maybe_compact() -> void {
    if (!journal || opts.compact_after_bytes == 0 || journal_bytes < opts.compact_after_bytes) return;
    if (auto r = compact_locked(); !r) {
      core::get_logger(core::kLogIndex)->warn("automatic compaction failed: {}", core::describe(r.error()));
    }
  }
};

auto aspect_index::impl::recover() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto log = core::get_logger(core::kLogIndex);
  const auto& dir = opts.dir;

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "cannot create store directory " + dir.string(), kComponent});

  std::uint64_t ckpt_lsn = 0;
  if (auto ck = load_checkpoint(dir); ck) {
    ckpt_lsn = ck->last_lsn;
    dim = ck->dim;
    for (auto& rec : ck->records) {
      apply_upsert(record_mutation{record_op::upsert, std::move(rec.photo_path), std::move(rec.aspect_name),
                                   std::move(rec.description), std::move(rec.embedding)});
    }
    log->info("loaded checkpoint at lsn {} ({} records)", ckpt_lsn, live());
  } else if (ck.error().code != error_code::not_found) {
    return std::unexpected(ck.error());
  }

  if (auto snap = wal::load_snapshot(dir); snap) {
    if (snap->last_lsn > ckpt_lsn) {
      return std::unexpected(error{error_code::data_integrity,
                                   "journal snapshot is ahead of the record checkpoint", kComponent});
    }
  } else if (snap.error().code != error_code::not_found) {
    return std::unexpected(snap.error());
  }

  auto stats = wal::recover_scan_dir(dir, ckpt_lsn, [this](const wal::WalFrame& f) -> std::expected<void, core::error> {
    if (f.type != wal::FRAME_RECORD_OP) {
      return std::unexpected(core::error{core::error_code::data_integrity, "unknown journal frame type", kComponent});
    }
    auto m = decode_mutation(f.payload);
    if (!m) return std::unexpected(m.error());
    journal_bytes += f.len;
    return apply(std::move(*m));
  });
  if (!stats) return std::unexpected(stats.error());

  if (stats->torn_tail) {
    log->warn("torn journal tail in {}; truncating to {} bytes", stats->tail_file.string(), stats->tail_valid_bytes);
    std::filesystem::resize_file(stats->tail_file, stats->tail_valid_bytes, ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "cannot truncate torn journal file", kComponent});
  }

  if (opts.embedding_dim != 0 && live() != 0 && dim != opts.embedding_dim) {
    return std::unexpected(error{error_code::config_invalid,
                                 "embedding_dim " + std::to_string(opts.embedding_dim) +
                                     " does not match stored dimension " + std::to_string(dim),
                                 kComponent});
  }
  if (live() == 0) dim = opts.embedding_dim;

  next_lsn = std::max(ckpt_lsn, stats->last_lsn) + 1;

  wal::WalWriterOptions wo{};
  wo.dir = dir;
  wo.max_file_bytes = opts.wal_max_file_bytes;
  wo.fsync_on_rotation = true;
  wo.fsync_on_flush = opts.sync_on_write;
  auto w = wal::WalWriter::open(wo);
  if (!w) return std::unexpected(w.error());
  journal = std::move(*w);

  log->info("opened store {} ({} records, dim {}, {} journal frames replayed)", dir.string(), live(), dim,
            stats->frames);
  return {};
}

aspect_index::aspect_index() : impl_(std::make_unique<impl>()) {}
aspect_index::~aspect_index() = default;
aspect_index::aspect_index(aspect_index&&) noexcept = default;
aspect_index& aspect_index::operator=(aspect_index&&) noexcept = default;

auto aspect_index::open(const aspect_index_options& opts) -> std::expected<aspect_index, core::error> {
  aspect_index idx;
  idx.impl_->opts = opts;
  idx.impl_->dim = opts.embedding_dim;
  if (!opts.dir.empty()) {
    if (auto r = idx.impl_->recover(); !r) return std::unexpected(r.error());
  }
  return idx;
}

auto aspect_index::open(const config& cfg) -> std::expected<aspect_index, core::error> {
  auto m = kernels::parse_metric(cfg.metric);
  if (!m) return std::unexpected(m.error());
  aspect_index_options opts;
  opts.dir = cfg.store_dir;
  opts.metric = *m;
  opts.embedding_dim = cfg.embedding_dim;
  opts.wal_max_file_bytes = cfg.wal_max_file_bytes;
  opts.sync_on_write = cfg.sync_on_write;
  opts.compact_after_bytes = cfg.compact_after_bytes;
  return open(opts);
}

auto aspect_index::upsert(std::string_view photo_path, std::string_view aspect_name,
                          std::span<const float> embedding, std::string_view description)
    -> std::expected<void, core::error> {
  if (photo_path.empty()) return std::unexpected(invalid("empty photo_path"));
  if (aspect_name.empty()) return std::unexpected(invalid("empty aspect_name"));

  std::unique_lock lock(impl_->mu);
  auto& s = *impl_;
  if (auto v = check_vector(embedding, s.dim, s.live() == 0 && s.opts.embedding_dim == 0); !v) {
    return std::unexpected(v.error());
  }
  record_mutation m{record_op::upsert, std::string(photo_path), std::string(aspect_name), std::string(description),
                    std::vector<float>(embedding.begin(), embedding.end())};
  if (auto r = s.journal_append(m); !r) return std::unexpected(r.error());
  s.apply_upsert(std::move(m));
  if (auto f = s.journal_flush(); !f) return f;
  s.maybe_compact();
  return {};
}

auto aspect_index::query(std::span<const float> embedding, std::size_t k,
                         std::optional<std::string_view> aspect_filter) const
    -> std::expected<std::vector<search_result>, core::error> {
  if (aspect_filter) return query(embedding, k, aspect_is(std::string(*aspect_filter)));

  std::shared_lock lock(impl_->mu);
  const auto& s = *impl_;
  if (auto v = check_vector(embedding, s.dim, s.live() == 0); !v) return std::unexpected(v.error());
  if (k == 0 || s.live() == 0) return std::vector<search_result>{};
  return s.rank(embedding, k, s.meta.get_all_ids());
}

auto aspect_index::query(std::span<const float> embedding, std::size_t k, const filter_expr& filter) const
    -> std::expected<std::vector<search_result>, core::error> {
  std::shared_lock lock(impl_->mu);
  const auto& s = *impl_;
  if (auto v = check_vector(embedding, s.dim, s.live() == 0); !v) return std::unexpected(v.error());
  if (k == 0 || s.live() == 0) return std::vector<search_result>{};
  auto candidates = s.meta.evaluate_filter(filter);
  if (!candidates) return std::unexpected(candidates.error());
  return s.rank(embedding, k, *candidates);
}

auto aspect_index::remove(std::string_view photo_path, std::optional<std::string_view> aspect_name)
    -> std::expected<std::size_t, core::error> {
  if (photo_path.empty()) return std::unexpected(invalid("empty photo_path"));
  if (aspect_name && aspect_name->empty()) return std::unexpected(invalid("empty aspect_name"));

  std::unique_lock lock(impl_->mu);
  auto& s = *impl_;
  if (aspect_name) {
    auto slot = s.find_slot(photo_path, *aspect_name);
    if (!slot) return std::size_t{0};
    record_mutation m{record_op::delete_key, std::string(photo_path), std::string(*aspect_name), {}, {}};
    if (auto r = s.journal_append(m); !r) return std::unexpected(r.error());
    s.erase_slot(*slot);
    if (auto f = s.journal_flush(); !f) return std::unexpected(f.error());
    s.maybe_compact();
    return std::size_t{1};
  }

  auto bm = s.meta.evaluate_filter(photo_is(std::string(photo_path)));
  if (!bm) return std::unexpected(bm.error());
  if (bm->isEmpty()) return std::size_t{0};
  record_mutation m{record_op::delete_photo, std::string(photo_path), {}, {}, {}};
  if (auto r = s.journal_append(m); !r) return std::unexpected(r.error());
  const auto n = s.apply_remove_photo(photo_path);
  if (auto f = s.journal_flush(); !f) return std::unexpected(f.error());
  s.maybe_compact();
  return n;
}

auto aspect_index::clear() -> std::expected<void, core::error> {
  std::unique_lock lock(impl_->mu);
  auto& s = *impl_;
  if (auto r = s.journal_append(record_mutation{record_op::clear, {}, {}, {}, {}}); !r) {
    return std::unexpected(r.error());
  }
  s.apply_clear();
  if (auto f = s.journal_flush(); !f) return f;
  core::get_logger(core::kLogIndex)->info("store cleared");
  s.maybe_compact();
  return {};
}

auto aspect_index::list_photo_paths() const -> std::vector<std::string> {
  std::shared_lock lock(impl_->mu);
  return impl_->meta.values_of(kFieldPhotoPath);
}

auto aspect_index::list_aspects() const -> std::vector<std::string> {
  std::shared_lock lock(impl_->mu);
  return impl_->meta.values_of(kFieldAspectName);
}

auto aspect_index::contains(std::string_view photo_path, std::string_view aspect_name) const -> bool {
  std::shared_lock lock(impl_->mu);
  return impl_->find_slot(photo_path, aspect_name).has_value();
}

auto aspect_index::get(std::string_view photo_path, std::string_view aspect_name) const
    -> std::optional<photo_record> {
  std::shared_lock lock(impl_->mu);
  auto slot = impl_->find_slot(photo_path, aspect_name);
  if (!slot) return std::nullopt;
  return impl_->slots[*slot];
}

auto aspect_index::records_for(std::string_view photo_path) const -> std::vector<photo_record> {
  std::shared_lock lock(impl_->mu);
  std::vector<photo_record> out;
  auto bm = impl_->meta.evaluate_filter(photo_is(std::string(photo_path)));
  if (!bm) return out;
  for (std::uint32_t slot : *bm) out.push_back(*impl_->slots[slot]);
  std::sort(out.begin(), out.end(),
            [](const photo_record& a, const photo_record& b) { return a.aspect_name < b.aspect_name; });
  return out;
}

auto aspect_index::size() const -> std::size_t {
  std::shared_lock lock(impl_->mu);
  return impl_->live();
}

auto aspect_index::dimension() const -> std::uint32_t {
  std::shared_lock lock(impl_->mu);
  return impl_->dim;
}

auto aspect_index::metric() const noexcept -> kernels::metric { return impl_->opts.metric; }

auto aspect_index::flush(bool sync) -> std::expected<void, core::error> {
  std::unique_lock lock(impl_->mu);
  if (!impl_->journal) return {};
  return impl_->journal->flush(sync);
}

auto aspect_index::compact() -> std::expected<void, core::error> {
  std::unique_lock lock(impl_->mu);
  return impl_->compact_locked();
}

auto aspect_index::impl::compact_locked() -> std::expected<void, core::error> {
  if (!journal) return {};
  if (auto r = journal->flush(true); !r) return r;

  checkpoint_image img;
  img.last_lsn = next_lsn - 1;
  img.dim = live() == 0 ? 0 : dim;
  img.records.reserve(live());
  for (const auto& rec : slots) {
    if (rec) img.records.push_back(*rec);
  }
  if (auto r = save_checkpoint(opts.dir, img); !r) return r;
  if (auto r = journal->rotate(); !r) return r;
  auto removed = wal::purge_wal(opts.dir, img.last_lsn);
  if (!removed) return std::unexpected(removed.error());
  journal_bytes = 0;
  core::get_logger(core::kLogIndex)
      ->info("compacted store at lsn {} ({} records, {} journal files purged)", img.last_lsn, img.records.size(),
             *removed);
  return {};
}

} // namespace photolens::index
