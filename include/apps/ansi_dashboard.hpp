#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

namespace psp {

// One bounded resource shown as a fill bar: the dispatch queue, the worker slots, the frame cache
struct GaugeView {
  std::string name;
  std::function<std::size_t()> used_fn;
  std::function<std::size_t()> cap_fn;
  std::string events_label; // e.g. "rejects", "timeouts", "evicts"
  std::function<std::uint64_t()> events_fn;
};

class AnsiDashboard {
public:
  AnsiDashboard(Metrics& metrics,
                std::vector<GaugeView> gauges,
                std::atomic_bool& sigint_flag,
                std::chrono::milliseconds period = std::chrono::milliseconds(1000));

  // Redraws every 'period' until 'stop' is requested
  void run(const StopToken& stop);

private:
  void draw(double dt);

  Metrics& metrics_;
  std::vector<GaugeView> gauges_;
  std::atomic_bool& sigint_;
  std::chrono::milliseconds period_;

  struct Prev { std::uint64_t count{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
  std::unordered_map<std::string, std::uint64_t> prev_events_;
};

} // namespace psp
