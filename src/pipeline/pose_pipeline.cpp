#include "pipeline/pose_pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace psp {

PosePipeline::PosePipeline(AppConfig cfg, WorkerFactory factory)
    : cfg_(std::move(cfg)),
      worker_metrics_(metrics_.make_stage("worker")),
      materialize_metrics_(metrics_.make_stage("materialize")),
      scheduler_(std::make_unique<DispatchScheduler>(cfg_.dispatch, std::move(factory), worker_metrics_)),
      store_(cfg_.cache, materialize_metrics_) {}

PosePipeline::~PosePipeline() {
  try {
    shutdown();
  } catch (const std::exception& e) {
    std::cerr << "[pose_pipeline] shutdown failed: " << e.what() << std::endl;
  }
}

void PosePipeline::start() {
  if (started_) return;
  scheduler_->start(stop_.token());
  started_ = true;
}

void PosePipeline::shutdown() {
  if (!started_.exchange(false)) return;
  stop_.request_stop();
  scheduler_->stop();
}

FramePayload PosePipeline::EncodeFrame(const cv::Mat& image, const WorkerConfig& cfg) {
  if (image.empty()) throw std::runtime_error("cannot encode an empty frame");

  std::vector<int> params;
  if (cfg.image_format == ".jpg" || cfg.image_format == ".jpeg") {
    params = {cv::IMWRITE_JPEG_QUALITY, cfg.jpeg_quality};
  }

  FramePayload payload;
  payload.image_size = image.size();
  if (!cv::imencode(cfg.image_format, image, payload.bytes, params)) {
    throw std::runtime_error("cv::imencode failed for format '" + cfg.image_format + "'");
  }
  return payload;
}

std::vector<FrameRequest> PosePipeline::encode(const std::vector<Frame>& frames) const {
  std::vector<FrameRequest> requests;
  requests.reserve(frames.size());
  for (const auto& f : frames) {
    FrameRequest r;
    r.frame_number = f.frame_number;
    r.payload = EncodeFrame(f.image, cfg_.worker);
    requests.push_back(std::move(r));
  }
  return requests;
}

DispatchReport PosePipeline::dispatch(std::vector<FrameRequest> requests) {
  const std::size_t n = requests.size();

  std::unordered_map<std::uint64_t, std::size_t> slot_of;
  slot_of.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (!slot_of.emplace(requests[i].frame_number, i).second) {
      throw std::invalid_argument("duplicate frame number " + std::to_string(requests[i].frame_number));
    }
  }

  auto raw = std::make_shared<RawSequence>(n);
  DispatchReport report;
  report.errors.resize(n);

  // Without a running dispatcher every slot stays empty, each with a Shutdown marker
  if (!started_) {
    std::cerr << "[pose_pipeline] dispatcher not running, " << n << " frame(s) left unprocessed" << std::endl;
    for (auto& e : report.errors) e = DispatchError{DispatchErrorKind::Shutdown, "dispatcher not running"};
    report.failed = n;
    report.raw = std::move(raw);
    return report;
  }

  const std::size_t window = std::max<std::size_t>(1, cfg_.dispatch.queue_max_size);
  const int max_attempts = std::max(1, cfg_.dispatch.retry.max_attempts);

  std::vector<std::size_t> pending(n);
  for (std::size_t i = 0; i < n; ++i) pending[i] = i;

  for (int attempt = 1; !pending.empty(); ++attempt) {
    std::vector<std::size_t> retry;

    for (std::size_t begin = 0; begin < pending.size(); begin += window) {
      const std::size_t end = std::min(pending.size(), begin + window);

      // Payloads are copied so a retry can resend them
      std::vector<FrameRequest> batch;
      batch.reserve(end - begin);
      for (std::size_t k = begin; k < end; ++k) batch.push_back(requests[pending[k]]);

      auto futures = scheduler_->submit(std::move(batch));

      for (auto& fut : futures) {
        DispatchResult r = fut.get();

        // Results are matched by frame number, not by position
        const auto it = slot_of.find(r.frame_number);
        if (it == slot_of.end()) {
          throw std::logic_error("dispatcher returned unknown frame " + std::to_string(r.frame_number));
        }
        const std::size_t slot = it->second;

        if (r.ok()) {
          (*raw)[slot] = std::move(*r.observation);
          report.errors[slot].reset();
          continue;
        }

        report.errors[slot] = *r.error;
        if (r.error->retryable() && attempt < max_attempts) retry.push_back(slot);
      }
    }

    if (retry.empty()) break;

    std::sort(retry.begin(), retry.end());
    report.retried += retry.size();
    std::cout << "[pose_pipeline] retrying " << retry.size() << " frame(s), attempt " << (attempt + 1) << "/"
              << max_attempts << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.dispatch.retry.backoff_ms * attempt));
    pending = std::move(retry);
  }

  for (std::size_t i = 0; i < n; ++i) {
    if ((*raw)[i]) {
      ++report.succeeded;
    } else {
      ++report.failed;
    }
  }

  if (report.failed > 0) {
    std::cerr << "[pose_pipeline] " << report.failed << " of " << n << " frame(s) could not be processed" << std::endl;
  }
  std::cout << "[pose_pipeline] dispatched " << n << " frame(s): " << report.succeeded << " ok, " << report.failed
            << " failed, " << report.retried << " retried" << std::endl;

  report.raw = std::move(raw);
  return report;
}

std::future<DispatchReport> PosePipeline::dispatch_async(std::vector<FrameRequest> requests) {
  return std::async(std::launch::async, [this, requests = std::move(requests)]() mutable {
    return dispatch(std::move(requests));
  });
}

BuildSummary PosePipeline::build(const DispatchReport& report, cv::Size frame_size) {
  if (!report.raw) throw std::invalid_argument("dispatch report has no raw sequence");

  BuildSummary summary;

  const QualityClassifier classifier(cfg_.quality, frame_size);
  summary.verdicts = classifier.classify(*report.raw);
  summary.quality = Summarize(summary.verdicts);

  const GapInterpolator interpolator(cfg_.interpolation.max_gap);
  LogicalFrameMap map = interpolator.interpolate(*report.raw, summary.verdicts, summary.gaps);

  store_.initialize(report.raw, std::move(map));

  std::cout << "[pose_pipeline] " << summary.gaps.total_frames << " logical frame(s): " << summary.gaps.direct
            << " direct, " << summary.gaps.interpolated << " interpolated, " << summary.gaps.unavailable
            << " unavailable" << std::endl;
  return summary;
}

BuildSummary PosePipeline::process(const std::vector<Frame>& frames) {
  cv::Size frame_size;
  if (!frames.empty()) frame_size = frames.front().image.size();

  DispatchReport report = dispatch(encode(frames));
  return build(report, frame_size);
}

} // namespace psp
