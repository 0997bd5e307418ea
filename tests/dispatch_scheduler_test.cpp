#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infra/stop_token.hpp"
#include "stages/dispatch_scheduler.hpp"

#include "check.hpp"
#include "fake_worker.hpp"

using namespace std::chrono_literals;
using psp::DispatchErrorKind;
using psp_test::FakeBehaviour;
using psp_test::FakeWorld;
using psp_test::Requests;

static bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 5000ms) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= until) return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

static bool Ready(std::future<psp::DispatchResult>& f, std::chrono::milliseconds wait = 0ms) {
  return f.wait_for(wait) == std::future_status::ready;
}

static psp::DispatchConfig Config(int max_workers, std::size_t queue, int spacing_ms) {
  psp::DispatchConfig cfg;
  cfg.max_concurrent_workers = max_workers;
  cfg.queue_max_size = queue;
  cfg.min_spawn_interval_ms = spacing_ms;
  cfg.per_request_timeout_ms = 10000;
  cfg.shutdown_timeout_ms = 10000;
  return cfg;
}

int main() {
  // Burst larger than the pool: never more than max_concurrent_workers awaiting at once, every request answered
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t, int) {
      FakeBehaviour b;
      b.hold = 15ms;
      return b;
    };

    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(3, 100, 0), world->factory());

    std::atomic<int> awaiting{0};
    std::atomic<int> peak{0};
    scheduler.set_state_observer([&](std::uint64_t, psp::WorkerState s) {
      if (s == psp::WorkerState::AwaitingResult) {
        const int now = ++awaiting;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
      } else if (psp::IsTerminal(s)) {
        --awaiting;
      }
    });
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(100, 20));
    CHECK(futures.size() == 20);

    std::set<std::uint64_t> frames;
    for (std::size_t i = 0; i < futures.size(); ++i) {
      CHECK(Ready(futures[i], 5000ms));
      const psp::DispatchResult r = futures[i].get();
      CHECK(r.ok());
      CHECK(r.frame_number == 100 + i);
      CHECK(r.observation && r.observation->frame_number == r.frame_number);
      CHECK(r.observation && r.observation->image_size == cv::Size(100, 100));
      frames.insert(r.frame_number);
    }
    CHECK(frames.size() == 20);

    CHECK(peak.load() <= 3);
    CHECK(world->peak_awaiting <= 3);

    scheduler.stop();
    const psp::DispatcherStatus s = scheduler.status();
    CHECK(s.peak_active_workers == 3);
    CHECK(s.submitted == 20 && s.spawned == 20 && s.processed == 20 && s.errors == 0);
    CHECK(s.active_workers == 0 && s.queued_requests == 0);
    CHECK(!s.running);
  }

  // Consecutive worker starts are at least min_spawn_interval_ms apart, even with free capacity
  {
    auto world = std::make_shared<FakeWorld>();
    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(8, 100, 30), world->factory());

    std::mutex mu;
    std::vector<std::chrono::steady_clock::time_point> starts;
    scheduler.set_state_observer([&](std::uint64_t, psp::WorkerState s) {
      if (s != psp::WorkerState::Spawning) return;
      std::lock_guard<std::mutex> lock(mu);
      starts.push_back(std::chrono::steady_clock::now());
    });
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(0, 5));
    for (auto& f : futures) CHECK(f.get().ok());
    scheduler.stop();

    std::lock_guard<std::mutex> lock(mu);
    CHECK(starts.size() == 5);
    for (std::size_t i = 1; i < starts.size(); ++i) {
      CHECK(starts[i] - starts[i - 1] >= 30ms);
    }
  }

  // Free workers take requests as they are admitted, so a burst larger than the queue is not rejected
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t, int) {
      FakeBehaviour b;
      b.wait_for_gate = true;
      return b;
    };

    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(8, 2, 0), world->factory());
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(0, 10));
    CHECK(WaitUntil([&] { return scheduler.status().active_workers == 8; }));
    CHECK(scheduler.status().queued_requests == 2);
    for (auto& f : futures) CHECK(!Ready(f));

    world->open_gate();
    for (auto& f : futures) CHECK(f.get().ok());
    scheduler.stop();
    CHECK(scheduler.status().errors_of(DispatchErrorKind::QueueFull) == 0);
  }

  // queue_max_size 2, the only worker busy: the third simultaneous request overflows
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t frame, int) {
      FakeBehaviour b;
      b.wait_for_gate = frame == 0;
      return b;
    };

    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(1, 2, 0), world->factory());
    scheduler.start(stop.token());

    auto busy = scheduler.submit(Requests(0, 1));
    CHECK(WaitUntil([&] { return scheduler.status().active_workers == 1; }));

    auto burst = scheduler.submit(Requests(1, 3));
    CHECK(Ready(burst[2], 2000ms));
    const psp::DispatchResult overflow = burst[2].get();
    CHECK(overflow.frame_number == 3);
    CHECK(overflow.error && overflow.error->kind == DispatchErrorKind::QueueFull);
    CHECK(overflow.error && overflow.error->retryable());
    CHECK(!overflow.observation);

    // Queued siblings are unaffected and wait for capacity
    CHECK(!Ready(burst[0]) && !Ready(burst[1]));
    CHECK(scheduler.status().queued_requests == 2);

    world->open_gate();
    CHECK(busy[0].get().ok());
    CHECK(burst[0].get().ok());
    CHECK(burst[1].get().ok());

    scheduler.stop();
    CHECK(scheduler.status().errors_of(DispatchErrorKind::QueueFull) == 1);
  }

  // A worker past its deadline is terminated and its request times out; siblings complete
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t frame, int) {
      FakeBehaviour b;
      b.wait_for_gate = frame == 7;
      return b;
    };

    psp::DispatchConfig cfg = Config(2, 10, 0);
    cfg.per_request_timeout_ms = 100;
    psp::StageMetrics latency("worker");
    psp::StopSource stop;
    psp::DispatchScheduler scheduler(cfg, world->factory(), &latency);
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(6, 3));
    const auto t0 = std::chrono::steady_clock::now();
    const psp::DispatchResult stuck = futures[1].get();
    CHECK(stuck.error && stuck.error->kind == DispatchErrorKind::Timeout);
    CHECK(stuck.error && stuck.error->retryable());
    CHECK(std::chrono::steady_clock::now() - t0 < 3s);

    CHECK(futures[0].get().ok());
    CHECK(futures[2].get().ok());

    CHECK(WaitUntil([&] { return scheduler.status().active_workers == 0; }));
    {
      std::lock_guard<std::mutex> lock(world->mu);
      CHECK(world->terminations == 1);
    }
    scheduler.stop();
    CHECK(latency.count.load() == 3);
    CHECK(latency.errors.load() == 1);
    CHECK(scheduler.status().errors_of(DispatchErrorKind::Timeout) == 1);
  }

  // Outcome mapping: a failed handoff wins over a clean exit; worker failures carry diagnostics
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t frame, int) {
      FakeBehaviour b;
      switch (frame) {
      case 1:
        b.transmission_failed = true; // exit code stays 0, output stays valid
        break;
      case 2:
        b.exit_code = 3;
        b.diagnostics = "CUDA out of memory";
        break;
      case 3:
        b.output = "{\"frameNumber\": 3, \"error\": \"no person detected\"}";
        break;
      case 4:
        b.output = "Traceback (most recent call last):";
        break;
      default:
        break;
      }
      return b;
    };

    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(4, 10, 0), world->factory());
    scheduler.start(stop.token());
    auto futures = scheduler.submit(Requests(0, 6));

    std::vector<psp::DispatchResult> r;
    for (auto& f : futures) r.push_back(f.get());

    CHECK(r[0].ok() && r[5].ok());
    CHECK(r[1].error && r[1].error->kind == DispatchErrorKind::Transmission);
    CHECK(!r[1].observation);
    CHECK(r[2].error && r[2].error->kind == DispatchErrorKind::Worker);
    CHECK(r[2].error && r[2].error->message.find("CUDA out of memory") != std::string::npos);
    CHECK(r[2].error && !r[2].error->retryable());
    CHECK(r[3].error && r[3].error->kind == DispatchErrorKind::Worker);
    CHECK(r[3].error && r[3].error->message.find("no person detected") != std::string::npos);
    CHECK(r[4].error && r[4].error->kind == DispatchErrorKind::Worker);

    scheduler.stop();
    const psp::DispatcherStatus s = scheduler.status();
    CHECK(s.processed == 2 && s.errors == 4);
  }

  // stop() fails queued requests, waits for the running one, then refuses new work
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t frame, int) {
      FakeBehaviour b;
      b.wait_for_gate = frame == 0;
      return b;
    };

    psp::StopSource stop;
    psp::DispatchScheduler scheduler(Config(1, 10, 0), world->factory());
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(0, 3));
    CHECK(WaitUntil([&] { return scheduler.status().active_workers == 1; }));

    std::thread stopper([&] { scheduler.stop(); });

    CHECK(Ready(futures[1], 2000ms) && Ready(futures[2], 2000ms));
    CHECK(futures[1].get().error->kind == DispatchErrorKind::Shutdown);
    CHECK(futures[2].get().error->kind == DispatchErrorKind::Shutdown);
    CHECK(!Ready(futures[0]));

    world->open_gate();
    stopper.join();
    CHECK(futures[0].get().ok());

    auto late = scheduler.submit(Requests(9, 1));
    CHECK(Ready(late[0]));
    const psp::DispatchResult refused = late[0].get();
    CHECK(refused.error && refused.error->kind == DispatchErrorKind::Shutdown);
    CHECK(refused.error && !refused.error->retryable());
    CHECK(!scheduler.status().running);
  }

  // A worker that never finishes is terminated once the shutdown timeout passes
  {
    auto world = std::make_shared<FakeWorld>();
    world->script = [](std::uint64_t, int) {
      FakeBehaviour b;
      b.wait_for_gate = true;
      return b;
    };

    psp::DispatchConfig cfg = Config(1, 10, 0);
    cfg.shutdown_timeout_ms = 100;
    psp::StopSource stop;
    psp::DispatchScheduler scheduler(cfg, world->factory());
    scheduler.start(stop.token());

    auto futures = scheduler.submit(Requests(0, 1));
    CHECK(WaitUntil([&] { return scheduler.status().active_workers == 1; }));

    const auto t0 = std::chrono::steady_clock::now();
    stop.request_stop();
    scheduler.stop();
    CHECK(std::chrono::steady_clock::now() - t0 < 3s);

    const psp::DispatchResult r = futures[0].get();
    CHECK(r.error && r.error->kind == DispatchErrorKind::Timeout);
  }

  // Constructor preconditions
  {
    auto world = std::make_shared<FakeWorld>();
    CHECK(psp_test::Throws<std::invalid_argument>([&] {
      (void)(psp::DispatchScheduler(Config(0, 10, 0), world->factory()));
    }));
    CHECK(psp_test::Throws<std::invalid_argument>([&] {
      (void)(psp::DispatchScheduler(Config(1, 10, -1), world->factory()));
    }));
    CHECK(psp_test::Throws<std::invalid_argument>([&] {
      (void)(psp::DispatchScheduler(Config(1, 10, 0), psp::WorkerFactory{}));
    }));
  }

  return psp_test::Finish("dispatch_scheduler_test");
}
