#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "infra/mailbox.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

#include "check.hpp"

int main() {
  using namespace std::chrono_literals;

  // Global stop ends the loop
  {
    psp::StopSource global_stop;
    psp::ThreadRunner runner("ticker");
    std::atomic<int> ticks{0};

    runner.start(global_stop.token(), [&](const psp::StopToken& global, const std::atomic_bool& local) {
      while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
        ++ticks;
        std::this_thread::sleep_for(5ms);
      }
    });

    std::this_thread::sleep_for(50ms);
    CHECK(runner.running());
    global_stop.request_stop();
    runner.join();
    CHECK(!runner.running());
    CHECK(ticks.load() > 0);

    CHECK(!runner.joinable());
  }

  // Local stop ends only this runner
  {
    psp::StopSource global_stop;
    psp::ThreadRunner runner("local");
    runner.start(global_stop.token(), [](const psp::StopToken& global, const std::atomic_bool& local) {
      while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) std::this_thread::sleep_for(1ms);
    });
    CHECK(psp_test::Throws<std::runtime_error>([&] {
      (void)(runner.start(global_stop.token(), [](const psp::StopToken&, const std::atomic_bool&) {}));
    }));
    runner.request_stop();
    runner.join();
    CHECK(!global_stop.stop_requested());
  }

  // An exception escaping the body is rethrown by join()
  {
    psp::ThreadRunner runner("thrower");
    runner.start(psp::StopToken{}, [](const psp::StopToken&, const std::atomic_bool&) {
      throw std::runtime_error("boom");
    });
    CHECK(psp_test::Throws<std::runtime_error>([&] { (void)(runner.join()); }));
    runner.join(); // error already delivered
  }

  // Mailbox: FIFO across threads, post fails once closed
  {
    psp::Mailbox<int> box;
    psp::ThreadRunner producer("producer");
    producer.start(psp::StopToken{}, [&](const psp::StopToken&, const std::atomic_bool&) {
      for (int i = 0; i < 100; ++i) {
        int v = i;
        if (!box.post(v)) return;
      }
    });

    int expected = 0;
    int v = -1;
    while (expected < 100 && box.try_pop_for(v, 1s)) {
      CHECK(v == expected);
      ++expected;
    }
    producer.join();
    CHECK(expected == 100);
    CHECK(!box.try_pop_for(v, 10ms));

    box.close();
    int late = 7;
    CHECK(!box.post(late));
    CHECK(late == 7);
    CHECK(box.closed());
  }

  return psp_test::Finish("thread_runner_test");
}
