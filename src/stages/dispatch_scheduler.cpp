#include "stages/dispatch_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace psp {

static constexpr auto kIdleWait = std::chrono::milliseconds(20);

DispatchScheduler::DispatchScheduler(DispatchConfig cfg, WorkerFactory factory, StageMetrics* latency)
    : Stage("dispatch_scheduler"),
      cfg_(std::move(cfg)),
      factory_(std::move(factory)),
      latency_(latency),
      created_(Clock::now()),
      queue_(cfg_.queue_max_size) {
  if (cfg_.max_concurrent_workers < 1) throw std::invalid_argument("max_concurrent_workers must be >= 1");
  if (cfg_.min_spawn_interval_ms < 0) throw std::invalid_argument("min_spawn_interval_ms must be >= 0");
  if (cfg_.per_request_timeout_ms < 1) throw std::invalid_argument("per_request_timeout_ms must be >= 1");
  if (!factory_) throw std::invalid_argument("worker factory is empty");
}

DispatchScheduler::~DispatchScheduler() {
  try {
    stop();
  } catch (const std::exception& e) {
    std::cerr << "[" << name() << "] error during shutdown: " << e.what() << std::endl;
  }
}

std::vector<std::future<DispatchResult>> DispatchScheduler::submit(std::vector<FrameRequest> batch) {
  std::vector<std::future<DispatchResult>> futures;
  futures.reserve(batch.size());

  Event ev{SubmitEvent{}};
  auto& submit = std::get<SubmitEvent>(ev);
  submit.requests.reserve(batch.size());

  for (auto& req : batch) {
    PendingRequest p;
    p.request = std::move(req);
    futures.push_back(p.promise.get_future());
    submit.requests.push_back(std::move(p));
  }

  submitted_.fetch_add(submit.requests.size(), std::memory_order_relaxed);

  if (!mailbox_.post(ev)) {
    // The loop has exited, nobody else will answer these
    for (auto& p : std::get<SubmitEvent>(ev).requests) {
      reject(p, DispatchErrorKind::Shutdown, "dispatcher is shut down");
    }
  }

  return futures;
}

DispatcherStatus DispatchScheduler::status() const {
  DispatcherStatus s;
  s.active_workers = active_published_.load(std::memory_order_relaxed);
  s.queued_requests = queue_.size();
  s.max_concurrent_workers = static_cast<std::size_t>(cfg_.max_concurrent_workers);
  s.queue_capacity = queue_.capacity();
  s.peak_active_workers = peak_active_.load(std::memory_order_relaxed);
  s.submitted = submitted_.load(std::memory_order_relaxed);
  s.spawned = spawned_.load(std::memory_order_relaxed);
  s.processed = processed_.load(std::memory_order_relaxed);
  s.errors = errors_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < s.errors_by_kind.size(); ++i) {
    s.errors_by_kind[i] = errors_by_kind_[i].load(std::memory_order_relaxed);
  }
  s.avg_latency_ms = latency_ ? latency_->avg_latency_ms() : 0.0;
  s.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - created_);
  s.running = running();
  return s;
}

void DispatchScheduler::run(const StopToken& global_stop, const std::atomic_bool& local_stop) {
  while (!global_stop.stop_requested() && !local_stop.load(std::memory_order_relaxed)) {
    Event ev;
    if (mailbox_.try_pop_for(ev, next_wakeup())) handle(ev, false);

    enforce_deadlines();
    schedule();
  }

  drain();
}

void DispatchScheduler::handle(Event& ev, bool draining) {
  if (auto* submit = std::get_if<SubmitEvent>(&ev)) {
    for (auto& pending : submit->requests) {
      if (draining) {
        reject(pending, DispatchErrorKind::Shutdown, "dispatcher is shutting down");
        continue;
      }
      admit(pending);
    }
    return;
  }

  on_completion(std::get<CompletionEvent>(ev));
}

void DispatchScheduler::admit(PendingRequest& pending) {
  const std::uint64_t frame = pending.request.frame_number;

  if (!queue_.try_push(pending)) {
    if (cfg_.debug) std::cout << "[" << name() << "] queue full, rejected frame " << frame << std::endl;
    reject(pending, DispatchErrorKind::QueueFull,
           "queue full (" + std::to_string(queue_.capacity()) + " requests waiting)");
    return;
  }

  if (cfg_.debug) {
    std::cout << "[" << name() << "] queued frame " << frame << " (" << queue_.size() << "/" << queue_.capacity()
              << ")" << std::endl;
  }

  // A request that can start right away starts before the next one is admitted
  schedule();
}

DispatchScheduler::Clock::duration DispatchScheduler::pacing_wait() const {
  if (!last_spawn_) return Clock::duration::zero();
  const auto ready_at = *last_spawn_ + std::chrono::milliseconds(cfg_.min_spawn_interval_ms);
  const auto now = Clock::now();
  return ready_at > now ? ready_at - now : Clock::duration::zero();
}

void DispatchScheduler::schedule() {
  while (active_ < static_cast<std::size_t>(cfg_.max_concurrent_workers) && !queue_.empty()) {
    if (pacing_wait() > Clock::duration::zero()) return; // the loop wakes up when the interval has passed

    PendingRequest next;
    if (!queue_.try_pop(next)) return;
    spawn(std::move(next));
  }
}

void DispatchScheduler::spawn(PendingRequest pending) {
  std::shared_ptr<Worker> worker;
  try {
    worker = factory_();
  } catch (const std::exception& e) {
    last_spawn_ = Clock::now();
    reject(pending, DispatchErrorKind::Worker, std::string("could not create worker: ") + e.what());
    return;
  }

  if (!worker) {
    last_spawn_ = Clock::now();
    reject(pending, DispatchErrorKind::Worker, "worker factory returned no worker");
    return;
  }
  if (observer_) worker->set_observer(observer_);

  // Started here rather than on the worker's thread, so the pacing clock follows actual starts
  try {
    worker->launch(pending.request);
  } catch (const std::exception& e) {
    last_spawn_ = Clock::now();
    reject(pending, DispatchErrorKind::Worker, std::string("could not start worker: ") + e.what());
    return;
  }
  const auto now = Clock::now();
  last_spawn_ = now;

  const std::uint64_t id = next_worker_id_++;
  const auto timeout = std::chrono::milliseconds(cfg_.per_request_timeout_ms);

  ActiveWorker& slot = workers_[id];
  slot.frame_number = pending.request.frame_number;
  slot.worker = worker;
  slot.spawned_at = now;
  slot.deadline = now + timeout;
  slot.promise = std::move(pending.promise);

  ++active_;
  active_published_.store(active_, std::memory_order_relaxed);
  spawned_.fetch_add(1, std::memory_order_relaxed);
  if (active_ > peak_active_.load(std::memory_order_relaxed)) peak_active_.store(active_, std::memory_order_relaxed);

  if (cfg_.debug) {
    std::cout << "[" << name() << "] spawned worker for frame " << slot.frame_number << " (" << active_ << "/"
              << cfg_.max_concurrent_workers << " active)" << std::endl;
  }

  slot.thread = std::thread([this, id, worker, timeout, request = std::move(pending.request)]() {
    DispatchResult result;
    try {
      result = ResolveOutcome(request, worker->run(request, timeout));
    } catch (const std::exception& e) {
      result = DispatchResult::Failure(request.frame_number, DispatchErrorKind::Worker, e.what());
    }

    Event done{CompletionEvent{id, std::move(result)}};
    if (!mailbox_.post(done)) {
      // Only possible if the loop exited while this worker was still registered
      std::cerr << "[" << name() << "] completion for frame " << request.frame_number << " was lost" << std::endl;
    }
  });
}

void DispatchScheduler::on_completion(CompletionEvent& ev) {
  auto it = workers_.find(ev.worker_id);
  if (it == workers_.end()) return;

  ActiveWorker& w = it->second;
  if (w.thread.joinable()) w.thread.join();

  if (latency_) {
    latency_->on_item(static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - w.spawned_at).count()));
    if (!ev.result.ok() || w.resolved) latency_->on_error();
  }

  // The watchdog may already have answered this request with Timeout
  if (!w.resolved) {
    if (cfg_.debug) {
      std::cout << "[" << name() << "] frame " << w.frame_number << " "
                << (ev.result.ok() ? "completed" : ToString(ev.result.error->kind)) << std::endl;
    }
    resolve(w.promise, std::move(ev.result));
  }

  workers_.erase(it);
  --active_;
  active_published_.store(active_, std::memory_order_relaxed);
}

void DispatchScheduler::enforce_deadlines() {
  const auto now = Clock::now();
  for (auto& entry : workers_) {
    ActiveWorker& w = entry.second;
    if (w.resolved || now < w.deadline) continue;

    w.worker->terminate();
    w.terminated = true;
    std::cerr << "[" << name() << "] frame " << w.frame_number << " exceeded " << cfg_.per_request_timeout_ms
              << " ms, worker terminated" << std::endl;
    resolve(w.promise, DispatchResult::Failure(w.frame_number, DispatchErrorKind::Timeout,
                                               "worker for frame " + std::to_string(w.frame_number) +
                                                   " timed out after " + std::to_string(cfg_.per_request_timeout_ms) +
                                                   " ms"));
    w.resolved = true;
  }
}

DispatchScheduler::Clock::duration DispatchScheduler::next_wakeup() const {
  Clock::duration wait = kIdleWait;

  if (!queue_.empty() && active_ < static_cast<std::size_t>(cfg_.max_concurrent_workers)) {
    wait = std::min(wait, pacing_wait());
  }

  const auto now = Clock::now();
  for (const auto& entry : workers_) {
    const ActiveWorker& w = entry.second;
    if (w.resolved) continue;
    wait = std::min<Clock::duration>(wait, w.deadline > now ? w.deadline - now : Clock::duration::zero());
  }

  return std::max<Clock::duration>(wait, std::chrono::milliseconds(1));
}

void DispatchScheduler::drain() {
  auto queued = queue_.drain();
  if (!queued.empty() || !workers_.empty()) {
    std::cout << "[" << name() << "] draining: " << queued.size() << " queued, " << workers_.size()
              << " running" << std::endl;
  }
  for (auto& pending : queued) reject(pending, DispatchErrorKind::Shutdown, "dispatcher is shutting down");

  // Running workers are never abandoned: their completion has to come back before the loop exits
  const auto force_at = Clock::now() + std::chrono::milliseconds(cfg_.shutdown_timeout_ms);
  bool forced = false;

  while (!workers_.empty()) {
    Event ev;
    if (mailbox_.try_pop_for(ev, kIdleWait)) handle(ev, true);

    enforce_deadlines();

    if (!forced && Clock::now() >= force_at) {
      forced = true;
      std::cerr << "[" << name() << "] shutdown timeout, terminating " << workers_.size() << " worker(s)"
                << std::endl;
      for (auto& entry : workers_) {
        entry.second.worker->terminate();
        entry.second.terminated = true;
      }
    }
  }

  mailbox_.close();

  // Submissions that raced with close()
  Event ev;
  while (mailbox_.try_pop(ev)) handle(ev, true);
}

void DispatchScheduler::resolve(std::promise<DispatchResult>& promise, DispatchResult result) {
  if (result.ok()) {
    processed_.fetch_add(1, std::memory_order_relaxed);
  } else if (result.error) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    errors_by_kind_[static_cast<std::size_t>(result.error->kind)].fetch_add(1, std::memory_order_relaxed);
  }
  promise.set_value(std::move(result));
}

void DispatchScheduler::reject(PendingRequest& pending, DispatchErrorKind kind, const std::string& message) {
  resolve(pending.promise, DispatchResult::Failure(pending.request.frame_number, kind, message));
}

} // namespace psp
