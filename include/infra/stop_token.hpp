#pragma once
#include <atomic>

/*
    StopSource / StopToken: cooperative shutdown for the pipeline's long-running threads.

    PosePipeline owns the StopSource. The dispatcher loop and the console dashboard each receive a
    read-only StopToken and also have a local stop flag from their ThreadRunner, so the dispatcher can be
    drained on its own while the dashboard keeps printing, or everything can be stopped at once.
*/

namespace psp {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  // A default-constructed token never requests a stop
  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_release); }

  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }

private:
  std::atomic_bool stop_{false};
};

} // namespace psp
