#include <atomic>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cache/frame_store.hpp"
#include "core/gap_interpolator.hpp"
#include "core/quality_classifier.hpp"

#include "check.hpp"
#include "pose_fixtures.hpp"

// Ten frames, 3 and 4 absent
static psp::RawSequencePtr TenWithHole() {
  auto raw = std::make_shared<psp::RawSequence>();
  for (std::size_t i = 0; i < 10; ++i) {
    if (i == 3 || i == 4) {
      raw->emplace_back();
    } else {
      raw->push_back(psp_test::MakePose(i, 20.f + 3.f * static_cast<float>(i), 50.f));
    }
  }
  return raw;
}

static psp::LogicalFrameMap Plan(const psp::RawSequence& raw, int max_gap) {
  const psp::VerdictSequence verdicts = psp::QualityClassifier(psp::QualityConfig{}).classify(raw);
  return psp::Interpolate(raw, verdicts, max_gap);
}

int main() {
  // Reading before initialize is a programming error
  {
    psp::FrameStore store(psp::CacheConfig{});
    CHECK(!store.initialized());
    CHECK(store.size() == 0);
    CHECK(psp_test::Throws<psp::NotInitializedError>([&] { (void)(store.get_frame(0)); }));
    CHECK(psp_test::Throws<psp::NotInitializedError>([&] { (void)(store.get_frame_range(0, 3)); }));
  }

  // Scenario: max_gap 5 fills 3 and 4 from frames 2 and 5 at 1/3 and 2/3
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 5));
    CHECK(store.size() == 10);

    const auto f3 = store.get_frame(3);
    const auto f4 = store.get_frame(4);
    CHECK(f3->interpolated() && f4->interpolated());
    CHECK(f3->recipe && f3->recipe->left_source_index == 2 && f3->recipe->right_source_index == 5);
    CHECK(f3->recipe && std::abs(f3->recipe->weight - 1.0 / 3.0) < 1e-12);
    CHECK(f4->recipe && std::abs(f4->recipe->weight - 2.0 / 3.0) < 1e-12);
    // Frame 2 centroid x = 26, frame 5 x = 35
    CHECK(f3->pose && std::abs(f3->pose->keypoints[0].x - 28.f) < 1e-4f);
    CHECK(f4->pose && std::abs(f4->pose->keypoints[0].x - 31.f) < 1e-4f);

    // Direct entries come back exactly as observed
    for (std::size_t i : {0u, 2u, 5u, 9u}) {
      const auto f = store.get_frame(i);
      CHECK(f->kind == psp::EntryKind::Direct && f->pose && *f->pose == *(*raw)[i]);
    }

    CHECK(psp_test::Throws<std::out_of_range>([&] { (void)(store.get_frame(10)); }));
    CHECK(psp_test::Throws<std::logic_error>([&] { (void)(store.initialize(raw, Plan(*raw, 5))); }));
  }

  // Scenario: max_gap 1 leaves 3 and 4 without data
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 1));

    const auto f3 = store.get_frame(3);
    const auto f4 = store.get_frame(4);
    CHECK(!f3->available() && !f3->pose && f3->logical_index == 3);
    CHECK(!f4->available() && !f4->pose);
    CHECK(store.stats().materializations == 0);
  }

  // Second read is a hit: same object, no new materialization
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 5));

    const auto first = store.get_frame(3);
    const auto second = store.get_frame(3);
    CHECK(first == second);
    CHECK(*first->pose == *second->pose);

    const psp::CacheStats s = store.stats();
    CHECK(s.materializations == 1);
    CHECK(s.hits == 1 && s.misses == 1);
    CHECK(psp_test::Near(s.hit_rate(), 0.5, 1e-12));

    // Dropping the cache forces a rebuild that yields the same frame
    store.clear_cache();
    CHECK(store.stats().size == 0);
    const auto rebuilt = store.get_frame(3);
    CHECK(rebuilt != first);
    CHECK(*rebuilt->pose == *first->pose);
    CHECK(store.stats().materializations == 2);
    CHECK(store.initialized());
  }

  // LRU eviction at capacity
  {
    const auto raw = TenWithHole();
    psp::CacheConfig cfg;
    cfg.capacity = 2;
    psp::FrameStore store(cfg);
    store.initialize(raw, Plan(*raw, 5));

    store.get_frame(0);
    store.get_frame(1);
    store.get_frame(0); // 1 is now least recently used
    store.get_frame(2); // evicts 1
    CHECK(store.stats().evictions == 1);
    CHECK(store.stats().size == 2);

    const auto before = store.stats().materializations;
    store.get_frame(0);
    CHECK(store.stats().materializations == before);
    store.get_frame(1);
    CHECK(store.stats().materializations == before + 1);
  }

  // Concurrent misses on one index collapse into a single materialization
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 5));

    constexpr int kThreads = 16;
    std::atomic<int> ready{0};
    std::vector<psp::FrameStore::FramePtr> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&, t] {
        ++ready;
        while (ready.load() < kThreads) std::this_thread::yield();
        seen[t] = store.get_frame(4);
      });
    }
    for (auto& th : threads) th.join();

    CHECK(store.stats().materializations == 1);
    for (const auto& f : seen) CHECK(f && f == seen[0]);
    const psp::CacheStats s = store.stats();
    CHECK(s.hits + s.misses == static_cast<std::uint64_t>(kThreads));
    CHECK(s.coalesced <= s.misses);
  }

  // Range query, clamped at the end
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 1));
    const auto range = store.get_frame_range(7, 42);
    CHECK(range.size() == 3);
    CHECK(range.size() == 3 && range[0]->logical_index == 7 && range[2]->logical_index == 9);
    CHECK(store.get_frame_range(2, 4).size() == 3);
    CHECK(psp_test::Throws<std::invalid_argument>([&] { (void)(store.get_frame_range(5, 2)); }));
  }

  // Reset returns to the uninitialized state and accepts a new sequence
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    store.initialize(raw, Plan(*raw, 5));
    store.get_frame(0);
    store.reset();
    CHECK(!store.initialized());
    CHECK(store.stats().materializations == 0);
    CHECK(psp_test::Throws<psp::NotInitializedError>([&] { (void)(store.get_frame(0)); }));
    store.initialize(raw, Plan(*raw, 1));
    CHECK(!store.get_frame(3)->available());
  }

  // Maps that do not fit the sequence are refused
  {
    const auto raw = TenWithHole();
    psp::FrameStore store(psp::CacheConfig{});
    psp::LogicalFrameMap short_map(9);
    CHECK(psp_test::Throws<std::invalid_argument>([&] { (void)(store.initialize(raw, short_map)); }));

    psp::LogicalFrameMap bad = Plan(*raw, 5);
    bad[6] = psp::LogicalFrameEntry::Direct(3); // slot 3 is empty
    CHECK(psp_test::Throws<std::invalid_argument>([&] { (void)(store.initialize(raw, bad)); }));

    CHECK(psp_test::Throws<std::invalid_argument>([&] { (void)(store.initialize(nullptr, psp::LogicalFrameMap{})); }));
    CHECK(!store.initialized());
  }

  return psp_test::Finish("frame_store_test");
}
