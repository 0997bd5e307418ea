#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace psp {

struct WorkerConfig {
  // argv of the external estimator, "{frame}" is replaced with the frame number
  std::vector<std::string> command{"python3", "pose_worker.py", "--frame", "{frame}"};
  std::string working_directory = "";

  std::string image_format = ".jpg";
  int jpeg_quality = 90;
};

struct RetryConfig {
  int max_attempts = 3;
  int backoff_ms = 500;
};

struct DispatchConfig {
  int max_concurrent_workers = 8;
  std::size_t queue_max_size = 100;
  int min_spawn_interval_ms = 50;
  int per_request_timeout_ms = 120000;
  int shutdown_timeout_ms = 30000;
  RetryConfig retry{};
  bool debug = false;
};

struct QualityConfig {
  float min_confidence = 0.6f;

  // Off-screen detection
  float off_screen_confidence = 0.3f;
  float off_screen_share = 0.5f;
  float boundary_margin = 0.05f;

  // Outlier detection (trend based)
  float outlier_deviation = 0.3f;
  int trend_window_size = 5;
};

struct InterpolationConfig {
  int max_gap = 10;
};

struct CacheConfig {
  std::size_t capacity = 512;
};

struct VideoConfig {
  int frame_stride = 1;
  int max_frames = 0; // 0 = whole video
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 1000;
  bool debug = false;
};

struct AppConfig {
  WorkerConfig worker{};
  DispatchConfig dispatch{};
  QualityConfig quality{};
  InterpolationConfig interpolation{};
  CacheConfig cache{};
  VideoConfig video{};
  MetricsConfig metrics{};
};

}
