#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

/*
    Implementation of bounded FIFO with admission control: a push into a full queue is refused, never queued
    and never allowed to displace older items, so every refused item can be answered by the caller.

    Only the dispatcher thread pushes and pops. The lock exists so that status readers on other threads see
    consistent sizes and counters.
*/

namespace psp {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity): capacity_(capacity) {}

  // No copy/move
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false and leaves 'item' untouched when the queue is at capacity
  bool try_push(T& item) {
    std::lock_guard<std::mutex> lock(mu_);

    ++pushes_;

    if (q_.size() >= capacity_) {
      ++rejections_;
      return false;
    }

    q_.push_back(std::move(item));
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lock(mu_);

    if (q_.empty()) return false;

    out = std::move(q_.front());

    q_.pop_front();

    ++pops_;

    return true;
  }

  // Removes and returns everything still queued, oldest first
  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<T> out;
    out.reserve(q_.size());
    for (auto& item : q_) out.push_back(std::move(item));
    q_.clear();
    return out;
  }

  // Getters

  bool empty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::uint64_t pushes_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
  }

  std::uint64_t pops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pops_;
  }

  std::uint64_t rejections_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return rejections_;
  }

private:
  const std::size_t capacity_;

  mutable std::mutex mu_;
  std::deque<T> q_;

  std::uint64_t pushes_{0};
  std::uint64_t pops_{0};
  std::uint64_t rejections_{0};
};

} // namespace psp
