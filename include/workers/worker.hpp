#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "core/frame.hpp"

/*
    Worker is one invocation of the external pose estimator for one frame.

    Lifecycle: Spawning -> Sending -> AwaitingResult -> {Completed | Failed | TimedOut}

    launch() performs the Spawning step and returns once the estimator has actually started (or failed to).
    The dispatcher calls it on its own thread so the pacing interval separates real starts. run() then does
    the I/O; it calls launch() itself when nobody did. Neither throws for per-request failures, those are
    reported in the WorkerOutcome of run(). terminate() may be called from another thread at any time and
    forces run() to return promptly.
*/

namespace psp {

enum class WorkerState {
  Idle,
  Spawning,
  Sending,
  AwaitingResult,
  Completed,
  Failed,
  TimedOut
};

const char* ToString(WorkerState s);

inline bool IsTerminal(WorkerState s) {
  return s == WorkerState::Completed || s == WorkerState::Failed || s == WorkerState::TimedOut;
}

struct WorkerOutcome {
  WorkerState state{WorkerState::Failed};

  // Set when handing the payload to the worker failed, regardless of how the worker exited afterwards
  bool transmission_failed{false};
  std::string transmission_error;

  int exit_code{-1};
  std::string output;      // stdout (the result document)
  std::string diagnostics; // stderr or a description of the failure

  std::chrono::nanoseconds elapsed{0};
};

// Called on every state change, from whichever thread runs the worker
using WorkerStateObserver = std::function<void(std::uint64_t frame_number, WorkerState state)>;

class Worker {
public:
  virtual ~Worker() = default;

  // At most once per worker; a failed start is reported by run()
  virtual void launch(const FrameRequest& request) = 0;

  virtual WorkerOutcome run(const FrameRequest& request, std::chrono::milliseconds timeout) = 0;

  // Forced termination, e.g. by the dispatcher's deadline watchdog
  virtual void terminate() = 0;

  WorkerState state() const { return state_.load(std::memory_order_acquire); }

  void set_observer(WorkerStateObserver observer) { observer_ = std::move(observer); }

protected:
  void enter(WorkerState s, std::uint64_t frame_number) {
    state_.store(s, std::memory_order_release);
    if (observer_) observer_(frame_number, s);
  }

private:
  std::atomic<WorkerState> state_{WorkerState::Idle};
  WorkerStateObserver observer_;
};

using WorkerFactory = std::function<std::unique_ptr<Worker>()>;

} // namespace psp
