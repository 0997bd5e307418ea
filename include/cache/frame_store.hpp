#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "core/config.hpp"
#include "core/logical_frame.hpp"
#include "core/pose_observation.hpp"
#include "infra/metrics.hpp"

/*
    FrameStore answers get_frame(logical_index) for playback.

    It is initialized exactly once with the raw sequence and its logical frame map, both read-only from then on.
    Materialized frames are kept in a bounded LRU cache. The cache only saves work: every entry can be rebuilt
    from the raw sequence and the map, and clear_cache() may drop them at any time.

    Concurrent misses on the same index share one materialization (singleflight); the others wait on its
    shared_future. The store's mutex only guards the bookkeeping and is never held while a frame is being
    materialized, so misses on different indices run in parallel.
*/

namespace psp {

class NotInitializedError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

struct CacheStats {
  std::size_t size{0};
  std::size_t capacity{0};
  std::size_t logical_frames{0};

  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t coalesced{0};        // misses that waited on another caller's materialization
  std::uint64_t materializations{0}; // Direct and Interpolated frames actually built
  std::uint64_t evictions{0};

  double avg_materialize_ms{0.0};

  double hit_rate() const {
    const std::uint64_t total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

class FrameStore {
public:
  using FramePtr = std::shared_ptr<const MaterializedFrame>;

  // 'metrics' (optional) receives one sample per materialization
  explicit FrameStore(CacheConfig cfg, StageMetrics* metrics = nullptr);

  FrameStore(const FrameStore&) = delete;
  FrameStore& operator=(const FrameStore&) = delete;

  // Throws std::logic_error if already initialized, std::invalid_argument if 'map' does not fit 'raw'
  void initialize(RawSequencePtr raw, LogicalFrameMap map);

  bool initialized() const;

  // Number of logical frames (0 before initialize)
  std::size_t size() const;

  // Throws NotInitializedError before initialize, std::out_of_range past the end.
  // Unavailable entries come back as a frame with kind Unavailable and no pose.
  FramePtr get_frame(std::size_t logical_index);

  // Inclusive range, clamped to the last frame
  std::vector<FramePtr> get_frame_range(std::size_t first, std::size_t last);

  LogicalFrameEntry entry(std::size_t logical_index) const;

  // Drops cached frames only
  void clear_cache();

  // Back to the uninitialized state, statistics included
  void reset();

  CacheStats stats() const;

private:
  struct CacheEntry {
    FramePtr frame;
    std::list<std::size_t>::iterator recency; // position in lru_
  };

  void check_ready(std::size_t logical_index) const; // mu_ held
  void insert(std::size_t logical_index, FramePtr frame); // mu_ held
  void drop_all(); // mu_ held

  const CacheConfig cfg_;
  StageMetrics* metrics_;

  mutable std::mutex mu_;

  RawSequencePtr raw_;
  std::shared_ptr<const LogicalFrameMap> map_;

  std::list<std::size_t> lru_; // front = most recently used
  std::unordered_map<std::size_t, CacheEntry> entries_;
  std::unordered_map<std::size_t, std::shared_future<FramePtr>> in_flight_;

  // Bumped by clear_cache/reset so materializations started earlier do not write back
  std::uint64_t generation_{0};

  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t coalesced_{0};
  std::uint64_t materializations_{0};
  std::uint64_t evictions_{0};
  std::uint64_t materialize_ns_total_{0};
};

} // namespace psp
