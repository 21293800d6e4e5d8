#include "apps/hud_overlay.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace flk {

static constexpr auto kHudPeriod = std::chrono::milliseconds(300);
static constexpr double kPanelAlpha = 0.75;

double HudOverlay::NsToMs(std::uint64_t ns) {
  return static_cast<double>(ns) / 1e6;
}

// The panel is rebuilt every kHudPeriod and blitted onto every frame in between.
// Stage rows show FPS, latency and failures, followed by the caller's status lines
void HudOverlay::draw(cv::Mat& bgr, const std::string& title, const Metrics& metrics,
                      const std::vector<StatusLine>& lines) {
  using clock = std::chrono::steady_clock;
  const auto now = clock::now();

  const bool needs_refresh =
      panel_.empty() || panel_.type() != bgr.type() || (now - last_refresh_ >= kHudPeriod);

  if (needs_refresh) {
    const auto now_ns = NowNs();

    double dt = 0.0;
    if (last_tick_ns_ != 0) dt = static_cast<double>(now_ns - last_tick_ns_) / 1e9;
    last_tick_ns_ = now_ns;
    last_refresh_ = now;

    const int line = 18;
    const int panel_w = 440;
    const int panel_h = 26 + line * (static_cast<int>(metrics.stages().size()) +
                                     static_cast<int>(lines.size()) + 3);

    panel_.create(panel_h, panel_w, bgr.type());
    panel_.setTo(cv::Scalar(0, 0, 0));
    cv::rectangle(panel_, cv::Rect(0, 0, panel_w, panel_h), cv::Scalar(0, 255, 0), 2);

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double scale = 0.5;
    const int thickness = 1;

    auto put_at = [&](int x, int y, const std::string& s, const cv::Scalar& color = cv::Scalar(255, 255, 255)) {
      cv::putText(panel_, s, cv::Point(x, y), font, scale, color, thickness, cv::LINE_AA);
    };

    const int x_name = 10;
    const int x_fps  = 140;
    const int x_lat  = 220;
    const int x_fail = 320;
    const int x_value = 180;

    int y = 22;
    cv::putText(panel_, title, cv::Point(x_name, y), font, 0.65, cv::Scalar(0, 255, 0), 2, cv::LINE_AA);
    y += line + 4;

    put_at(x_name, y, "STAGE");
    put_at(x_fps,  y, "FPS");
    put_at(x_lat,  y, "LAT(ms)");
    put_at(x_fail, y, "FAIL");
    y += line;

    for (const StageSnapshot& m : metrics.snapshot()) {
      auto& p = prev_stage_[m.name];
      const double fps = (dt > 0.0) ? (static_cast<double>(m.count - p.count) / dt) : 0.0;
      p.count = m.count;

      std::ostringstream s_fps, s_lat;
      s_fps << std::fixed << std::setprecision(1) << fps;
      s_lat << std::fixed << std::setprecision(1) << NsToMs(m.avg_latency_ns);

      put_at(x_name, y, m.name);
      put_at(x_fps,  y, s_fps.str());
      put_at(x_lat,  y, s_lat.str());
      put_at(x_fail, y, std::to_string(m.failures), m.failures > 0 ? cv::Scalar(0, 0, 255) : cv::Scalar(255, 255, 255));
      y += line;
    }

    y += 6;
    for (const auto& l : lines) {
      put_at(x_name, y, l.label);
      put_at(x_value, y, l.value, l.alert ? cv::Scalar(0, 0, 255) : cv::Scalar(255, 255, 255));
      y += line;
    }
  }

  if (panel_.empty()) return;

  // Blend the panel over the top-left corner, the frame stays visible underneath
  const int margin = 10;
  const int w = std::min(panel_.cols, bgr.cols - 2 * margin);
  const int h = std::min(panel_.rows, bgr.rows - 2 * margin);
  if (w <= 0 || h <= 0) return;

  cv::Mat roi = bgr(cv::Rect(margin, margin, w, h));
  cv::addWeighted(panel_(cv::Rect(0, 0, w, h)), kPanelAlpha, roi, 1.0 - kPanelAlpha, 0.0, roi);
}

} // namespace flk
