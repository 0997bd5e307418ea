#include <iostream>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/videoio.hpp>
#include <yaml-cpp/yaml.h>

// Utilities
#include "core/config_loader.hpp"
#include "core/frame.hpp"
#include "core/frame_table.hpp"

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

#include "apps/ansi_dashboard.hpp"
#include "pipeline/pose_pipeline.hpp"
#include "workers/subprocess_worker.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// Decodes every frame_stride-th frame, stopping after max_frames (0 = no limit)
static std::vector<psp::Frame> ReadFrames(const std::string& path, const psp::VideoConfig& cfg) {
  cv::VideoCapture cap(path);
  if (!cap.isOpened()) throw std::runtime_error("cannot open video: " + path);

  std::vector<psp::Frame> frames;
  const int stride = std::max(1, cfg.frame_stride);

  cv::Mat image;
  for (std::uint64_t index = 0; cap.read(image); ++index) {
    if (g_sigint.load(std::memory_order_relaxed)) break;
    if (index % static_cast<std::uint64_t>(stride) != 0) continue;

    psp::Frame f;
    f.frame_number = index;
    f.capture_time = std::chrono::steady_clock::now();
    f.image = image.clone();
    frames.push_back(std::move(f));

    if (cfg.max_frames > 0 && frames.size() >= static_cast<std::size_t>(cfg.max_frames)) break;
  }
  return frames;
}

static void SaveFrameTable(const std::string& path, psp::FrameStore& store, const psp::BuildSummary& summary) {
  std::vector<psp::FrameStore::FramePtr> frames;
  if (store.size() > 0) frames = store.get_frame_range(0, store.size() - 1);

  YAML::Emitter out;
  psp::WriteFrameTable(out, frames, summary.verdicts, summary.gaps.interpolation_percentage());

  std::ofstream file(path);
  if (!file) throw std::runtime_error("cannot write " + path);
  file << out.c_str() << "\n";
}

// analyze_video runs the whole pipeline over one recorded video:
// decode -> external pose workers -> quality filter -> gap interpolation -> frame table

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <video> [config.yaml] [frames_out.yaml]\n";
    return 2;
  }
  const std::string video_path = argv[1];
  const std::string cfg_path = (argc > 2) ? argv[2] : "configs/dev.yaml";
  const std::string out_path = (argc > 3) ? argv[3] : "frames.yaml";

  try {
    psp::AppConfig cfg = psp::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);

    std::vector<psp::Frame> frames = ReadFrames(video_path, cfg.video);
    std::cout << "Decoded " << frames.size() << " frame(s) from " << video_path << "\n";
    if (frames.empty()) return 1;

    psp::PosePipeline pipeline(cfg, psp::MakeSubprocessWorkerFactory(cfg.worker));

    // Console dashboard on its own thread
    std::unique_ptr<psp::AnsiDashboard> dashboard;
    psp::ThreadRunner dashboard_runner("dashboard");
    if (cfg.metrics.enable_console_log) {
      const psp::DispatchScheduler* scheduler = &pipeline.scheduler();
      psp::FrameStore* store = &pipeline.store();
      std::vector<psp::GaugeView> gauges{
          {"queue", [scheduler] { return scheduler->status().queued_requests; },
           [scheduler] { return scheduler->status().queue_capacity; }, "rejects",
           [scheduler] { return scheduler->status().errors_of(psp::DispatchErrorKind::QueueFull); }},
          {"workers", [scheduler] { return scheduler->status().active_workers; },
           [scheduler] { return scheduler->status().max_concurrent_workers; }, "timeouts",
           [scheduler] { return scheduler->status().errors_of(psp::DispatchErrorKind::Timeout); }},
          {"cache", [store] { return store->stats().size; }, [store] { return store->stats().capacity; }, "evicts",
           [store] { return store->stats().evictions; }},
      };
      dashboard = std::make_unique<psp::AnsiDashboard>(pipeline.metrics(), std::move(gauges), g_sigint,
                                                       std::chrono::milliseconds(cfg.metrics.log_interval_ms));
      psp::AnsiDashboard* view = dashboard.get();
      dashboard_runner.start(psp::StopToken{}, [view](const psp::StopToken&, const std::atomic_bool& local_stop) {
        view->run(psp::StopToken(&local_stop));
      });
    }

    pipeline.start();

    const cv::Size frame_size = frames.front().image.size();
    std::future<psp::DispatchReport> pending = pipeline.dispatch_async(pipeline.encode(frames));
    frames.clear();

    // Ctrl-C drains the dispatcher; whatever finished still makes it into the report
    while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        std::cout << "\nShutting down dispatcher..." << std::endl;
        pipeline.shutdown();
        break;
      }
    }
    psp::DispatchReport report = pending.get();
    pipeline.shutdown();

    psp::BuildSummary summary = pipeline.build(report, frame_size);
    SaveFrameTable(out_path, pipeline.store(), summary);

    dashboard_runner.request_stop();
    if (dashboard_runner.joinable()) dashboard_runner.join();

    const psp::DispatcherStatus ds = pipeline.scheduler().status();
    const psp::CacheStats cs = pipeline.store().stats();

    std::cout << "\nDispatch: " << ds.processed << " ok, " << ds.errors << " errors (timeout "
              << ds.errors_of(psp::DispatchErrorKind::Timeout) << ", transmission "
              << ds.errors_of(psp::DispatchErrorKind::Transmission) << ", worker "
              << ds.errors_of(psp::DispatchErrorKind::Worker) << ", queue full "
              << ds.errors_of(psp::DispatchErrorKind::QueueFull) << "), avg latency " << ds.avg_latency_ms
              << " ms\n";
    std::cout << "Quality: " << summary.quality.accepted << " accepted, " << summary.quality.low_confidence
              << " low confidence, " << summary.quality.off_screen << " off screen, " << summary.quality.outlier
              << " outliers, " << summary.quality.absent << " absent\n";
    std::cout << "Gaps: " << summary.gaps.runs.size() << " run(s), " << summary.gaps.interpolated
              << " frame(s) interpolated (" << summary.gaps.interpolation_percentage() << "%), "
              << summary.gaps.unavailable << " unavailable"
              << (summary.gaps.has_start_gap ? ", gap at start" : "") << (summary.gaps.has_end_gap ? ", gap at end" : "")
              << "\n";
    std::cout << "Cache: " << cs.size << "/" << cs.capacity << " entries, " << cs.materializations
              << " materialized\n";
    std::cout << "Frame table written to " << out_path << "\n";

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
