#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/mailbox.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"
#include "workers/dispatch_result.hpp"
#include "workers/worker.hpp"

/*
    DispatchScheduler turns bursts of frame requests into a bounded, paced stream of worker invocations.

    All bookkeeping (admission queue, active count, pacing clock, running workers) belongs to the stage's loop
    thread. Other threads talk to it through the mailbox only:
        - submit() posts the whole batch as one event and returns one future per request
        - each worker runs on its own thread and posts a completion event when it ends

    Per request, in submission order: if the queue is full the request fails with QueueFull, otherwise it is
    queued and the loop immediately tries to start it. A worker starts only while fewer than
    max_concurrent_workers are active and at least min_spawn_interval_ms have passed since the previous start.
    Worker::launch() runs on the loop thread, so that interval separates actual process starts.
    A worker that outlives per_request_timeout_ms is terminated and its request fails with Timeout.

    stop() drains: queued requests fail with Shutdown, running workers are awaited (and force-terminated after
    shutdown_timeout_ms), and requests submitted after that fail with Shutdown.
*/

namespace psp {

struct DispatcherStatus {
  std::size_t active_workers{0};
  std::size_t queued_requests{0};
  std::size_t max_concurrent_workers{0};
  std::size_t queue_capacity{0};
  std::size_t peak_active_workers{0};

  std::uint64_t submitted{0};
  std::uint64_t spawned{0};
  std::uint64_t processed{0}; // resolved with an observation
  std::uint64_t errors{0};    // resolved with any error, QueueFull and Shutdown included
  std::array<std::uint64_t, 5> errors_by_kind{}; // indexed by DispatchErrorKind

  double avg_latency_ms{0.0};
  std::chrono::milliseconds uptime{0};
  bool running{false};

  std::uint64_t errors_of(DispatchErrorKind k) const { return errors_by_kind[static_cast<std::size_t>(k)]; }
};

class DispatchScheduler : public Stage {
public:
  using Clock = std::chrono::steady_clock;

  // 'latency' (optional) receives one sample per finished worker
  DispatchScheduler(DispatchConfig cfg, WorkerFactory factory, StageMetrics* latency = nullptr);
  ~DispatchScheduler() override;

  // One future per request, in the batch's order, each resolved as soon as that request settles.
  // Requests submitted before start() wait in the mailbox; after stop() they resolve with Shutdown.
  std::vector<std::future<DispatchResult>> submit(std::vector<FrameRequest> batch);

  DispatcherStatus status() const;

  // Forwarded to every worker; call before start()
  void set_state_observer(WorkerStateObserver observer) { observer_ = std::move(observer); }

  const DispatchConfig& config() const { return cfg_; }

protected:
  void run(const StopToken& global_stop, const std::atomic_bool& local_stop) override;

private:
  struct PendingRequest {
    FrameRequest request;
    std::promise<DispatchResult> promise;
  };

  struct SubmitEvent {
    std::vector<PendingRequest> requests;
  };

  struct CompletionEvent {
    std::uint64_t worker_id{0};
    DispatchResult result;
  };

  using Event = std::variant<SubmitEvent, CompletionEvent>;

  struct ActiveWorker {
    std::uint64_t frame_number{0};
    std::shared_ptr<Worker> worker;
    std::thread thread;
    Clock::time_point spawned_at;
    Clock::time_point deadline;
    std::promise<DispatchResult> promise;
    bool resolved{false};
    bool terminated{false};
  };

  void handle(Event& ev, bool draining);
  void admit(PendingRequest& pending);
  void schedule();
  void spawn(PendingRequest pending);
  void on_completion(CompletionEvent& ev);
  void enforce_deadlines();
  void drain();

  // Every request is resolved through here exactly once
  void resolve(std::promise<DispatchResult>& promise, DispatchResult result);
  void reject(PendingRequest& pending, DispatchErrorKind kind, const std::string& message);

  Clock::duration pacing_wait() const;
  Clock::duration next_wakeup() const;

  DispatchConfig cfg_;
  WorkerFactory factory_;
  StageMetrics* latency_;
  WorkerStateObserver observer_;
  const Clock::time_point created_;

  Mailbox<Event> mailbox_;
  BoundedQueue<PendingRequest> queue_;

  // Loop-owned state
  std::map<std::uint64_t, ActiveWorker> workers_;
  std::size_t active_{0};
  std::optional<Clock::time_point> last_spawn_;
  std::uint64_t next_worker_id_{0};

  // Published for status()
  std::atomic<std::size_t> active_published_{0};
  std::atomic<std::size_t> peak_active_{0};
  std::atomic<std::uint64_t> submitted_{0};
  std::atomic<std::uint64_t> spawned_{0};
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::array<std::atomic<std::uint64_t>, 5> errors_by_kind_{};
};

} // namespace psp
