#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "cache/frame_store.hpp"
#include "core/config.hpp"
#include "core/frame.hpp"
#include "core/gap_interpolator.hpp"
#include "core/logical_frame.hpp"
#include "core/pose_observation.hpp"
#include "core/quality_classifier.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/dispatch_scheduler.hpp"
#include "workers/dispatch_result.hpp"
#include "workers/worker.hpp"

/*
    PosePipeline wires the pieces together for one video:

        frames -> encode -> DispatchScheduler -> RawSequence -> QualityClassifier -> GapInterpolator -> FrameStore

    Slot i of the raw sequence belongs to the i-th request, whatever its frame number. Requests are submitted
    in windows no larger than the dispatch queue, and requests that fail with a retryable error are resubmitted
    after a linear backoff, up to retry.max_attempts attempts in total. A request that still fails leaves its
    slot empty with the last error recorded next to it, so one bad frame never costs the rest of the batch.
*/

namespace psp {

struct DispatchReport {
  RawSequencePtr raw;
  std::vector<std::optional<DispatchError>> errors; // set exactly where raw slot is empty

  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t retried{0}; // resubmissions, summed over all attempts
};

struct BuildSummary {
  VerdictSequence verdicts;
  QualitySummary quality;
  GapReport gaps;
};

class PosePipeline {
public:
  PosePipeline(AppConfig cfg, WorkerFactory factory);
  ~PosePipeline();

  PosePipeline(const PosePipeline&) = delete;
  PosePipeline& operator=(const PosePipeline&) = delete;

  // Starts the dispatcher loop
  void start();

  // Drains the dispatcher: queued requests fail with Shutdown, running workers are awaited
  void shutdown();

  // Throws std::runtime_error when the image is empty or cannot be encoded
  static FramePayload EncodeFrame(const cv::Mat& image, const WorkerConfig& cfg);

  std::vector<FrameRequest> encode(const std::vector<Frame>& frames) const;

  // Blocks until every request has settled. Throws std::invalid_argument on duplicate frame numbers.
  // Outside start()/shutdown() nothing is sent and every slot comes back empty with a Shutdown error.
  DispatchReport dispatch(std::vector<FrameRequest> requests);

  // Same as dispatch, on a separate thread
  std::future<DispatchReport> dispatch_async(std::vector<FrameRequest> requests);

  // Classifies, plans gaps and initializes the frame store; 'frame_size' covers observations without their own
  BuildSummary build(const DispatchReport& report, cv::Size frame_size = cv::Size());

  // encode + dispatch + build
  BuildSummary process(const std::vector<Frame>& frames);

  FrameStore& store() { return store_; }
  const DispatchScheduler& scheduler() const { return *scheduler_; }
  Metrics& metrics() { return metrics_; }
  const AppConfig& config() const { return cfg_; }

private:
  AppConfig cfg_;
  Metrics metrics_;
  StopSource stop_;

  StageMetrics* worker_metrics_;
  StageMetrics* materialize_metrics_;

  std::unique_ptr<DispatchScheduler> scheduler_;
  FrameStore store_;
  std::atomic_bool started_{false};
};

} // namespace psp
