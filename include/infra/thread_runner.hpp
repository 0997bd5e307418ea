#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one long-lived thread (the dispatcher loop, the console dashboard).
    It provides:
        - start/stop/join with the same semantics everywhere
        - a local stop flag for this thread only, plus read access to the pipeline-wide StopToken
        - capture of an exception escaping the thread body, rethrown from join()
*/

namespace psp {

class ThreadRunner {
public:
  // Any callable that takes the global stop token and the local stop flag
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  // Remove copy/move
  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  // Requests a local stop and joins; a pending thread error is dropped here, call join() to observe it
  ~ThreadRunner();

  // Throws std::runtime_error if the thread is already running
  void start(StopToken global_stop, Fn fn);

  // Stops this thread only
  void request_stop();
  // True if either the global or the local stop was requested
  bool stop_requested() const;

  // Joins, then rethrows whatever escaped the thread body
  void join();
  bool joinable() const;

  // True from start() until the thread body returns
  bool running() const { return running_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::atomic_bool running_{false};
  StopToken global_stop_{};
  std::exception_ptr error_;
  std::string name_{"thread"};
};

} // namespace psp
