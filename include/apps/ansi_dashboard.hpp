#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

namespace flk {

// One "label: value" row of a status panel
struct StatusLine {
  std::string label;
  std::string value;
  bool alert{false};
};

using StatusFn = std::function<std::vector<StatusLine>()>;

// Periodic terminal report: per-stage throughput table plus the app's own status lines
class AnsiDashboard {
public:
  AnsiDashboard(std::string title, Metrics& metrics, StatusFn status, int interval_ms);

  // Redraws until either flag is set, matches ThreadRunner::Fn
  void run(const StopToken& global_stop, const std::atomic_bool& local_stop);

  // Render one report into a string, dt_s is the time since the previous one
  std::string render(double dt_s);

private:
  std::string title_;
  Metrics& metrics_;
  StatusFn status_;
  int interval_ms_;

  struct Prev { std::uint64_t count{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<std::string, Prev> prev_stage_;  // Keyed by stage name
};

} // namespace flk
