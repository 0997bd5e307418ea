#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

/*
    Mailbox is the event channel in front of a single-owner loop.

    Any thread may post; exactly one thread consumes, one event at a time. The consumer closes the mailbox
    when it is about to exit, after which post() fails so producers can answer the request themselves instead
    of leaving it in a channel nobody reads.
*/

namespace psp {

template <typename T>
class Mailbox {
public:
  Mailbox() = default;

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  // Returns false if the mailbox was closed; 'item' is left untouched in that case
  bool post(T& item) {
    std::unique_lock<std::mutex> lock(mu_);
    if (closed_) return false;
    q_.push_back(std::move(item));
    lock.unlock();
    cv_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mu_);
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  // Timeout variant of Pop function
  template <typename Rep, typename Period>
  bool try_pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&] { return !q_.empty(); })) return false;

    out = std::move(q_.front());
    q_.pop_front();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_{false};
};

} // namespace psp
