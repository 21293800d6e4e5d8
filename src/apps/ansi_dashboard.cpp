#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace flk {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

AnsiDashboard::AnsiDashboard(std::string title, Metrics& metrics, StatusFn status, int interval_ms)
    : title_(std::move(title)), metrics_(metrics), status_(std::move(status)), interval_ms_(interval_ms) {}

// One report. Per stage: FPS, Busy % (thread utilization), average latency, Last (time since the stage
// last did anything, aka staleness) and failures. Then the app status lines
std::string AnsiDashboard::render(double dt) {
  const auto now_ns = NowNs();
  std::ostringstream out;

  out << title_ << "\n\n";

  out << std::left
      << std::setw(14) << "STAGE"
      << std::setw(10) << "FPS"
      << std::setw(10) << "BUSY%"
      << std::setw(12) << "LAT(ms)"
      << std::setw(12) << "LAST(ms)"
      << std::setw(8)  << "FAIL"
      << "\n";
  out << std::string(14 + 10 + 10 + 12 + 12 + 8, '-') << "\n";

  for (const StageSnapshot& m : metrics_.snapshot()) {
    auto& p = prev_stage_[m.name];

    const double fps = (dt > 0) ? (static_cast<double>(m.count - p.count) / dt) : 0.0;
    double busy = (dt > 0) ? static_cast<double>(m.work_ns_total - p.work_ns) / (dt * 1e9) : 0.0;
    busy = std::max(0.0, std::min(1.0, busy));
    auto busy_color = (busy > 0.85) ? kRed : (busy > 0.60) ? kYellow : kGreen;
    p.count = m.count;
    p.work_ns = m.work_ns_total;

    const double lat_ms = NsToMs(m.avg_latency_ns);
    const double last_ms = (m.last_event_ns == 0 || m.last_event_ns > now_ns) ? 0.0 : NsToMs(now_ns - m.last_event_ns);

    out << std::left
        << std::setw(14) << m.name
        << std::setw(10) << std::fixed << std::setprecision(1) << fps
        << busy_color << std::setw(10) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
        << std::setw(12) << std::fixed << std::setprecision(1) << lat_ms
        << std::setw(12) << std::fixed << std::setprecision(1) << last_ms
        << (m.failures > 0 ? kRed : kReset) << std::setw(8) << m.failures << kReset
        << "\n";
  }

  if (status_) {
    out << "\nSTATUS\n";
    for (const auto& line : status_()) {
      out << "  " << std::setw(18) << std::left << line.label
          << (line.alert ? kRed : kGreen) << line.value << kReset
          << "\033[K\n";
    }
  }

  return out.str();
}

void AnsiDashboard::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono;

  std::cout << "\033[2J\033[H" << std::flush;

  auto last = steady_clock::now();
  auto next = last + milliseconds(interval_ms_);

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    // Short sleeps so a stop request is seen quickly even with a long interval
    std::this_thread::sleep_for(milliseconds(std::min(interval_ms_, 50)));
    const auto now = steady_clock::now();
    if (now < next) continue;
    next = now + milliseconds(interval_ms_);

    const double dt = duration_cast<duration<double>>(now - last).count();
    last = now;

    std::cout << "\033[H" << render(dt) << "\n" << std::flush;
  }
}

} // namespace flk
