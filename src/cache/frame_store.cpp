#include "cache/frame_store.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "core/frame_blend.hpp"

namespace psp {

FrameStore::FrameStore(CacheConfig cfg, StageMetrics* metrics) : cfg_(cfg), metrics_(metrics) {
  if (cfg_.capacity < 1) throw std::invalid_argument("cache capacity must be >= 1");
}

void FrameStore::initialize(RawSequencePtr raw, LogicalFrameMap map) {
  if (!raw) throw std::invalid_argument("FrameStore::initialize: raw sequence is null");
  if (map.size() != raw->size()) {
    throw std::invalid_argument("FrameStore::initialize: map has " + std::to_string(map.size()) +
                                " entries for " + std::to_string(raw->size()) + " frames");
  }

  // Every entry must be materializable, checked once here instead of on every read
  for (std::size_t i = 0; i < map.size(); ++i) {
    const LogicalFrameEntry& e = map[i];
    if (e.kind == EntryKind::Direct && (e.source_index >= raw->size() || !(*raw)[e.source_index])) {
      throw std::invalid_argument("FrameStore::initialize: entry " + std::to_string(i) +
                                  " points at an empty slot");
    }
    if (e.kind == EntryKind::Interpolated) {
      if (!e.recipe) throw std::invalid_argument("FrameStore::initialize: entry " + std::to_string(i) + " has no recipe");
      const InterpolationRecipe& r = *e.recipe;
      if (r.left_source_index >= raw->size() || r.right_source_index >= raw->size() ||
          !(*raw)[r.left_source_index] || !(*raw)[r.right_source_index] || r.weight < 0.0 || r.weight > 1.0) {
        throw std::invalid_argument("FrameStore::initialize: entry " + std::to_string(i) + " has an invalid recipe");
      }
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (raw_) throw std::logic_error("FrameStore::initialize called twice");

  raw_ = std::move(raw);
  map_ = std::make_shared<const LogicalFrameMap>(std::move(map));
}

bool FrameStore::initialized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return raw_ != nullptr;
}

std::size_t FrameStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return map_ ? map_->size() : 0;
}

void FrameStore::check_ready(std::size_t logical_index) const {
  if (!raw_) throw NotInitializedError("FrameStore used before initialize");
  if (logical_index >= map_->size()) {
    throw std::out_of_range("logical frame " + std::to_string(logical_index) + " out of range (" +
                            std::to_string(map_->size()) + " frames)");
  }
}

FrameStore::FramePtr FrameStore::get_frame(std::size_t logical_index) {
  std::shared_ptr<std::promise<FramePtr>> owner;
  std::shared_future<FramePtr> pending;
  RawSequencePtr raw;
  LogicalFrameEntry entry;
  std::uint64_t generation = 0;

  {
    std::lock_guard<std::mutex> lock(mu_);
    check_ready(logical_index);
    entry = (*map_)[logical_index];

    if (entry.kind != EntryKind::Unavailable) {
      auto hit = entries_.find(logical_index);
      if (hit != entries_.end()) {
        ++hits_;
        lru_.splice(lru_.begin(), lru_, hit->second.recency);
        return hit->second.frame;
      }

      ++misses_;
      auto running = in_flight_.find(logical_index);
      if (running != in_flight_.end()) {
        ++coalesced_;
        pending = running->second;
      } else {
        owner = std::make_shared<std::promise<FramePtr>>();
        in_flight_.emplace(logical_index, owner->get_future().share());
      }
      raw = raw_;
      generation = generation_;
    }
  }

  if (entry.kind == EntryKind::Unavailable) {
    auto none = std::make_shared<MaterializedFrame>();
    none->logical_index = logical_index;
    none->kind = EntryKind::Unavailable;
    return none;
  }

  // Another caller is already building this frame; rethrows if that failed
  if (pending.valid()) return pending.get();

  const std::uint64_t t0 = NowNs();
  FramePtr frame;
  try {
    frame = std::make_shared<const MaterializedFrame>(Materialize(*raw, entry, logical_index));
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (generation == generation_) in_flight_.erase(logical_index);
    }
    owner->set_exception(std::current_exception());
    throw;
  }
  const std::uint64_t elapsed = NowNs() - t0;
  if (metrics_) metrics_->on_item(elapsed);

  {
    std::lock_guard<std::mutex> lock(mu_);
    ++materializations_;
    materialize_ns_total_ += elapsed;
    if (generation == generation_) {
      in_flight_.erase(logical_index);
      insert(logical_index, frame);
    }
  }

  owner->set_value(frame);
  return frame;
}

std::vector<FrameStore::FramePtr> FrameStore::get_frame_range(std::size_t first, std::size_t last) {
  std::size_t count;
  {
    std::lock_guard<std::mutex> lock(mu_);
    check_ready(first);
    count = map_->size();
  }
  if (last < first) throw std::invalid_argument("get_frame_range: last < first");

  last = std::min(last, count - 1);
  std::vector<FramePtr> out;
  out.reserve(last - first + 1);
  for (std::size_t i = first; i <= last; ++i) out.push_back(get_frame(i));
  return out;
}

LogicalFrameEntry FrameStore::entry(std::size_t logical_index) const {
  std::lock_guard<std::mutex> lock(mu_);
  check_ready(logical_index);
  return (*map_)[logical_index];
}

void FrameStore::insert(std::size_t logical_index, FramePtr frame) {
  if (entries_.count(logical_index) != 0) return;

  while (entries_.size() >= cfg_.capacity && !lru_.empty()) {
    entries_.erase(lru_.back());
    lru_.pop_back();
    ++evictions_;
  }

  lru_.push_front(logical_index);
  entries_.emplace(logical_index, CacheEntry{std::move(frame), lru_.begin()});
}

void FrameStore::drop_all() {
  entries_.clear();
  lru_.clear();
  // Waiters keep their shared_futures; the owners see the new generation and skip the write-back
  in_flight_.clear();
  ++generation_;
}

void FrameStore::clear_cache() {
  std::lock_guard<std::mutex> lock(mu_);
  drop_all();
}

void FrameStore::reset() {
  std::lock_guard<std::mutex> lock(mu_);
  drop_all();
  raw_.reset();
  map_.reset();
  hits_ = misses_ = coalesced_ = materializations_ = evictions_ = materialize_ns_total_ = 0;
}

CacheStats FrameStore::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  CacheStats s;
  s.size = entries_.size();
  s.capacity = cfg_.capacity;
  s.logical_frames = map_ ? map_->size() : 0;
  s.hits = hits_;
  s.misses = misses_;
  s.coalesced = coalesced_;
  s.materializations = materializations_;
  s.evictions = evictions_;
  s.avg_materialize_ms =
      materializations_ == 0 ? 0.0 : static_cast<double>(materialize_ns_total_) / 1e6 / static_cast<double>(materializations_);
  return s;
}

} // namespace psp
