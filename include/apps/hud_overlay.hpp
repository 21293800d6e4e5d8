#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/ansi_dashboard.hpp"
#include "infra/metrics.hpp"

namespace flk {

// Diagnostics panel drawn into the top-left corner of the displayed frame
class HudOverlay {
public:
  HudOverlay() = default;

  void draw(cv::Mat& bgr,
            const std::string& title,
            const Metrics& metrics,
            const std::vector<StatusLine>& lines);

private:
  std::chrono::steady_clock::time_point last_refresh_{};
  cv::Mat panel_;

  struct Prev { std::uint64_t count{0}; };

  std::unordered_map<std::string, Prev> prev_stage_;

  std::uint64_t last_tick_ns_{0};

  static double NsToMs(std::uint64_t ns);
};

} // namespace flk
