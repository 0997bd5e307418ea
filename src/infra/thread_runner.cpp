#include "infra/thread_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace psp {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
  if (error_) std::cerr << "[" << name_ << "] thread exited with an unobserved error\n";
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  global_stop_ = global_stop;
  error_ = nullptr;
  running_.store(true, std::memory_order_release);

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (...) {
      // Handed to join(), which rethrows on the owning thread
      error_ = std::current_exception();
    }
    running_.store(false, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
  if (error_) {
    std::exception_ptr e = std::exchange(error_, nullptr);
    std::rethrow_exception(e);
  }
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace psp
