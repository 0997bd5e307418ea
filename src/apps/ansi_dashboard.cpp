#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <thread>

namespace psp {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

// Fill a simple bar based on ratio of used/cap
static std::string Bar(std::size_t used, std::size_t cap, std::size_t width) {
  if (cap == 0) return std::string(width, '.');
  const double frac = std::min(1.0, static_cast<double>(used) / static_cast<double>(cap));

  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

static const char* LoadColor(double frac) {
  return (frac > 0.85) ? kRed : (frac > 0.60) ? kYellow : kGreen;
}

AnsiDashboard::AnsiDashboard(Metrics& metrics, std::vector<GaugeView> gauges, std::atomic_bool& sigint_flag,
                             std::chrono::milliseconds period)
    : metrics_(metrics), gauges_(std::move(gauges)), sigint_(sigint_flag), period_(period) {}

void AnsiDashboard::run(const StopToken& stop) {
  using namespace std::chrono;

  std::cout << "\033[2J\033[H" << std::flush;

  auto last = steady_clock::now();

  while (!stop.stop_requested()) {
    std::this_thread::sleep_for(period_);

    const auto now = steady_clock::now();
    const double dt = duration_cast<duration<double>>(now - last).count();
    last = now;

    draw(dt);
  }

  // Final numbers stay on screen after the run
  draw(0.0);
}

// Per activity: throughput, error count, share of wall time spent working (summed over parallel workers, so it
// can exceed 100% for the worker row), average latency and time since the last event
void AnsiDashboard::draw(double dt) {
  const auto now_ns = NowNs();

  std::cout << "\033[H";
  std::cout << "POSE SEQUENCE PIPELINE\n";
  std::cout << "SIGINT: " << (sigint_.load(std::memory_order_relaxed) ? "pending" : "ok") << "\n\n";

  std::cout << std::left
            << std::setw(14) << "ACTIVITY"
            << std::setw(10) << "DONE"
            << std::setw(8)  << "ERR"
            << std::setw(10) << "PER/s"
            << std::setw(10) << "BUSY%"
            << std::setw(12) << "LAT(ms)"
            << std::setw(14) << "LAST(ms)"
            << "\n";
  std::cout << std::string(14 + 10 + 8 + 10 + 10 + 12 + 14, '-') << "\n";

  for (const auto& up : metrics_.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto c = m.count.load(std::memory_order_relaxed);
    const double rate = (dt > 0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
    p.count = c;

    const auto work = m.work_ns_total.load(std::memory_order_relaxed);
    const double busy = (dt > 0) ? std::max(0.0, static_cast<double>(work - p.work_ns) / (dt * 1e9)) : 0.0;
    p.work_ns = work;

    const double lat_ms = NsToMs(m.avg_latency_ns.load(std::memory_order_relaxed));
    const auto le = m.last_event_ns.load(std::memory_order_relaxed);
    const double last_ms = (le == 0 || le > now_ns) ? 0.0 : NsToMs(now_ns - le);

    std::cout << std::left
              << std::setw(14) << m.name
              << std::setw(10) << c
              << std::setw(8)  << m.errors.load(std::memory_order_relaxed)
              << std::setw(10) << std::fixed << std::setprecision(1) << rate
              << LoadColor(busy) << std::setw(10) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
              << std::setw(12) << std::fixed << std::setprecision(1) << lat_ms
              << std::setw(20) << std::fixed << std::setprecision(1) << last_ms
              << "\n";
  }

  std::cout << "\nRESOURCES\n";
  for (const auto& g : gauges_) {
    const auto used = g.used_fn ? g.used_fn() : 0;
    const auto cap  = g.cap_fn ? g.cap_fn() : 0;
    const double frac = (cap == 0) ? 0.0 : static_cast<double>(used) / static_cast<double>(cap);

    std::cout << "  " << std::setw(11) << std::left << g.name
              << " " << LoadColor(frac) << std::setw(11) << (std::to_string(used) + "/" + std::to_string(cap))
              << " [" << Bar(used, cap, 24) << "]" << kReset;

    if (g.events_fn) {
      const std::uint64_t total = g.events_fn();
      std::uint64_t& prev_total = prev_events_[g.name];
      const double per_s = dt > 0 ? (static_cast<double>(total - prev_total) / dt) : 0.0;
      prev_total = total;
      std::cout << "  " << g.events_label << "=" << total
                << " (" << std::fixed << std::setprecision(1) << per_s << "/s)";
    }
    std::cout << "\n";
  }

  std::cout << "\n" << std::flush;
}

} // namespace psp
