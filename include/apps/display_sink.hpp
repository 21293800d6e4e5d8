#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/ansi_dashboard.hpp"
#include "apps/hud_overlay.hpp"
#include "core/config.hpp"
#include "core/frame_receiver.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

namespace flk {

// Frames-per-second over windows of 'window' observed frames
class ThroughputMeter {
public:
  explicit ThroughputMeter(int window = 10) : window_(window) {}

  void on_frame(std::chrono::steady_clock::time_point now);
  double fps() const { return fps_; }

private:
  int window_;
  int in_window_{0};
  std::chrono::steady_clock::time_point window_start_{};
  bool started_{false};
  double fps_{0.0};
};

/*
    DisplaySink polls the receiver's current-frame slot at its own cadence and shows whatever is newest.
    It only ever reads the slot, so a slow window never slows down ingest; frames that were overwritten
    before the next poll are simply never shown.

    OpenCV windows must live on the main thread, so run() is called from main().
*/
class DisplaySink {
public:
  DisplaySink(DisplayConfig cfg, std::shared_ptr<FrameReceiver> receiver, Metrics& metrics);

  DisplaySink(const DisplaySink&) = delete;
  DisplaySink& operator=(const DisplaySink&) = delete;

  // Poll + render until 'q'/ESC or stop is requested. Requests stop on exit
  void run(StopSource& stop);

  // One poll of the slot. Returns true when a frame newer than the last one was picked up
  bool poll();

  // Key handling, returns false when the user asked to quit
  bool handle_key(int key);

  // Compose the image that would be shown right now (waiting screen, or frame + HUD)
  cv::Mat compose();

  // Write the current frame to screenshot_dir, returns the path or "" when there is nothing to save
  std::string save_screenshot() const;

  std::uint64_t frames_displayed() const { return displayed_.load(std::memory_order_relaxed); }
  double fps() const { return meter_.fps(); }

  std::vector<StatusLine> status_lines() const;

private:
  DisplayConfig cfg_;
  std::shared_ptr<FrameReceiver> receiver_;
  Metrics& metrics_;
  HudOverlay hud_;
  ThroughputMeter meter_;

  LatestStore<DecodedFrame>::Ptr current_;
  std::uint64_t seen_version_{0};
  std::atomic<std::uint64_t> displayed_{0};  // Read by the status threads
};

} // namespace flk
