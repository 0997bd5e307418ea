#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace psp {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadWorker(const YAML::Node& root, WorkerConfig& cfg) {
  const YAML::Node w = root["worker"];
  if (!w) return;
  const std::string p = "worker";

  const YAML::Node cmd = Child(w, "command");
  if (cmd) {
    if (!cmd.IsSequence()) throw ConfigError(PathJoin(p, "command"), "must be a list of arguments");
    cfg.command = GetOrKey<std::vector<std::string>>(w, "command", PathJoin(p, "command"), cfg.command);
  }
  cfg.working_directory = GetOrKey<std::string>(w, "working_directory", PathJoin(p, "working_directory"), cfg.working_directory);
  cfg.image_format = GetOrKey<std::string>(w, "image_format", PathJoin(p, "image_format"), cfg.image_format);
  cfg.jpeg_quality = GetOrKey<int>(w, "jpeg_quality", PathJoin(p, "jpeg_quality"), cfg.jpeg_quality);
}

static void LoadDispatch(const YAML::Node& root, DispatchConfig& cfg) {
  const YAML::Node d = root["dispatch"];
  if (!d) return;
  const std::string p = "dispatch";

  cfg.max_concurrent_workers = GetOrKey<int>(d, "max_concurrent_workers", PathJoin(p, "max_concurrent_workers"), cfg.max_concurrent_workers);
  cfg.queue_max_size = GetOrKey<std::size_t>(d, "queue_max_size", PathJoin(p, "queue_max_size"), cfg.queue_max_size);
  cfg.min_spawn_interval_ms = GetOrKey<int>(d, "min_spawn_interval_ms", PathJoin(p, "min_spawn_interval_ms"), cfg.min_spawn_interval_ms);
  cfg.per_request_timeout_ms = GetOrKey<int>(d, "per_request_timeout_ms", PathJoin(p, "per_request_timeout_ms"), cfg.per_request_timeout_ms);
  cfg.shutdown_timeout_ms = GetOrKey<int>(d, "shutdown_timeout_ms", PathJoin(p, "shutdown_timeout_ms"), cfg.shutdown_timeout_ms);

  const YAML::Node r = d["retry"];
  const std::string rp = PathJoin(p, "retry");
  if (r) {
    cfg.retry.max_attempts = GetOrKey<int>(r, "max_attempts", PathJoin(rp, "max_attempts"), cfg.retry.max_attempts);
    cfg.retry.backoff_ms = GetOrKey<int>(r, "backoff_ms", PathJoin(rp, "backoff_ms"), cfg.retry.backoff_ms);
  }
}

static void LoadQuality(const YAML::Node& root, QualityConfig& cfg) {
  const YAML::Node q = root["quality"];
  if (!q) return;
  const std::string p = "quality";

  cfg.min_confidence = GetOrKey<float>(q, "min_confidence", PathJoin(p, "min_confidence"), cfg.min_confidence);
  cfg.off_screen_confidence = GetOrKey<float>(q, "off_screen_confidence", PathJoin(p, "off_screen_confidence"), cfg.off_screen_confidence);
  cfg.off_screen_share = GetOrKey<float>(q, "off_screen_share", PathJoin(p, "off_screen_share"), cfg.off_screen_share);
  cfg.boundary_margin = GetOrKey<float>(q, "boundary_margin", PathJoin(p, "boundary_margin"), cfg.boundary_margin);
  cfg.outlier_deviation = GetOrKey<float>(q, "outlier_deviation", PathJoin(p, "outlier_deviation"), cfg.outlier_deviation);
  cfg.trend_window_size = GetOrKey<int>(q, "trend_window_size", PathJoin(p, "trend_window_size"), cfg.trend_window_size);
}

static void LoadInterpolation(const YAML::Node& root, InterpolationConfig& cfg) {
  const YAML::Node i = root["interpolation"];
  if (!i) return;
  cfg.max_gap = GetOrKey<int>(i, "max_gap", "interpolation.max_gap", cfg.max_gap);
}

static void LoadCache(const YAML::Node& root, CacheConfig& cfg) {
  const YAML::Node c = root["cache"];
  if (!c) return;
  cfg.capacity = GetOrKey<std::size_t>(c, "capacity", "cache.capacity", cfg.capacity);
}

static void LoadVideo(const YAML::Node& root, VideoConfig& cfg) {
  const YAML::Node v = root["video"];
  if (!v) return;
  const std::string p = "video";

  cfg.frame_stride = GetOrKey<int>(v, "frame_stride", PathJoin(p, "frame_stride"), cfg.frame_stride);
  cfg.max_frames = GetOrKey<int>(v, "max_frames", PathJoin(p, "max_frames"), cfg.max_frames);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
  cfg.debug = GetOrKey<bool>(m, "debug", PathJoin(p, "debug"), cfg.debug);
}

static void InRange01(float v, const char* key_path) {
  if (v < 0.f || v > 1.f) throw ConfigError(key_path, "must be in [0, 1]");
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.worker.command.empty() || cfg.worker.command.front().empty())
    throw ConfigError("worker.command", "must name an executable");
  if (cfg.worker.image_format.empty() || cfg.worker.image_format.front() != '.')
    throw ConfigError("worker.image_format", "must be a file extension such as '.jpg'");
  if (cfg.worker.jpeg_quality < 1 || cfg.worker.jpeg_quality > 100)
    throw ConfigError("worker.jpeg_quality", "must be in [1, 100]");

  if (cfg.dispatch.max_concurrent_workers < 1) throw ConfigError("dispatch.max_concurrent_workers", "must be >= 1");
  if (cfg.dispatch.queue_max_size < 1) throw ConfigError("dispatch.queue_max_size", "must be >= 1");
  if (cfg.dispatch.min_spawn_interval_ms < 0) throw ConfigError("dispatch.min_spawn_interval_ms", "must be >= 0");
  if (cfg.dispatch.per_request_timeout_ms < 1) throw ConfigError("dispatch.per_request_timeout_ms", "must be >= 1");
  if (cfg.dispatch.shutdown_timeout_ms < 0) throw ConfigError("dispatch.shutdown_timeout_ms", "must be >= 0");
  if (cfg.dispatch.retry.max_attempts < 1) throw ConfigError("dispatch.retry.max_attempts", "must be >= 1");
  if (cfg.dispatch.retry.backoff_ms < 0) throw ConfigError("dispatch.retry.backoff_ms", "must be >= 0");

  InRange01(cfg.quality.min_confidence, "quality.min_confidence");
  InRange01(cfg.quality.off_screen_confidence, "quality.off_screen_confidence");
  InRange01(cfg.quality.off_screen_share, "quality.off_screen_share");
  InRange01(cfg.quality.outlier_deviation, "quality.outlier_deviation");
  if (cfg.quality.boundary_margin < 0.f || cfg.quality.boundary_margin > 0.5f)
    throw ConfigError("quality.boundary_margin", "must be in [0, 0.5]");
  if (cfg.quality.trend_window_size < 3 || cfg.quality.trend_window_size > 20)
    throw ConfigError("quality.trend_window_size", "must be in [3, 20]");

  if (cfg.interpolation.max_gap < 1 || cfg.interpolation.max_gap > 100)
    throw ConfigError("interpolation.max_gap", "must be in [1, 100]");

  if (cfg.cache.capacity < 1) throw ConfigError("cache.capacity", "must be >= 1");

  if (cfg.video.frame_stride < 1) throw ConfigError("video.frame_stride", "must be >= 1");
  if (cfg.video.max_frames < 0) throw ConfigError("video.max_frames", "must be >= 0");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadWorker(root, cfg.worker);
  LoadDispatch(root, cfg.dispatch);
  LoadQuality(root, cfg.quality);
  LoadInterpolation(root, cfg.interpolation);
  LoadCache(root, cfg.cache);
  LoadVideo(root, cfg.video);
  LoadMetrics(root, cfg.metrics);

  // Verbose dispatch logs follow the global debug switch
  cfg.dispatch.debug = cfg.metrics.debug;

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace psp
