#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "apps/display_sink.hpp"
#include "core/frame_receiver.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

using namespace std::chrono_literals;

namespace {

flk::DisplayConfig Headless() {
  flk::DisplayConfig cfg;
  cfg.enabled = false;
  cfg.poll_interval_ms = 1;
  return cfg;
}

void Push(flk::FrameReceiver& rx, int w = 80, int h = 60) {
  std::vector<std::uint8_t> jpeg;
  cv::imencode(".jpg", cv::Mat(h, w, CV_8UC3, cv::Scalar(90, 90, 90)), jpeg);
  REQUIRE(rx.ingest(jpeg.data(), jpeg.size(), 0).decoded);
}

} // namespace

TEST_CASE("throughput meter reports fps per window", "[display]") {
  flk::ThroughputMeter meter(10);
  const auto t0 = std::chrono::steady_clock::now();

  meter.on_frame(t0);
  REQUIRE(meter.fps() == 0.0);

  // 10 more frames, 50 ms apart: 10 frames over 0.5 s
  for (int i = 1; i <= 10; ++i) meter.on_frame(t0 + i * 50ms);
  REQUIRE(meter.fps() == Approx(20.0));

  // Not updated until the next window completes
  for (int i = 11; i <= 15; ++i) meter.on_frame(t0 + i * 10ms);
  REQUIRE(meter.fps() == Approx(20.0));
}

TEST_CASE("poll picks up only frames it has not seen", "[display]") {
  flk::Metrics metrics;
  auto rx = std::make_shared<flk::FrameReceiver>(flk::ReceiverConfig{});
  flk::DisplaySink sink(Headless(), rx, metrics);

  REQUIRE_FALSE(sink.poll());

  Push(*rx);
  REQUIRE(sink.poll());
  REQUIRE_FALSE(sink.poll());
  REQUIRE(sink.frames_displayed() == 1);

  // Two frames between polls: the older one is never shown
  Push(*rx);
  Push(*rx);
  REQUIRE(sink.poll());
  REQUIRE(sink.frames_displayed() == 2);
  REQUIRE(rx->stats().frame_count == 3);
}

TEST_CASE("compose shows a waiting screen, then the frame", "[display]") {
  flk::Metrics metrics;
  metrics.make_stage("decode");
  auto rx = std::make_shared<flk::FrameReceiver>(flk::ReceiverConfig{});
  flk::DisplaySink sink(Headless(), rx, metrics);

  const cv::Mat waiting = sink.compose();
  REQUIRE(waiting.cols == 640);
  REQUIRE(waiting.rows == 480);

  Push(*rx, 320, 240);
  sink.poll();
  const cv::Mat shown = sink.compose();
  REQUIRE(shown.cols == 320);
  REQUIRE(shown.rows == 240);

  // The overlay is drawn on a copy
  REQUIRE(rx->current_frame()->image.data != shown.data);
}

TEST_CASE("keys: q and ESC quit, s saves a screenshot", "[display]") {
  const auto dir = std::filesystem::temp_directory_path() / "framelink_display_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  flk::DisplayConfig cfg = Headless();
  cfg.screenshot_dir = dir.string();

  flk::Metrics metrics;
  auto rx = std::make_shared<flk::FrameReceiver>(flk::ReceiverConfig{});
  flk::DisplaySink sink(cfg, rx, metrics);

  REQUIRE(sink.handle_key(-1));
  REQUIRE_FALSE(sink.handle_key('q'));
  REQUIRE_FALSE(sink.handle_key(27));

  // Nothing to save yet
  REQUIRE(sink.save_screenshot().empty());

  Push(*rx);
  sink.poll();
  REQUIRE(sink.handle_key('s'));

  int files = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir)) {
    if (e.path().extension() == ".jpg") ++files;
  }
  REQUIRE(files == 1);

  std::filesystem::remove_all(dir);
}

TEST_CASE("run returns once stop is requested", "[display]") {
  flk::Metrics metrics;
  auto rx = std::make_shared<flk::FrameReceiver>(flk::ReceiverConfig{});
  flk::DisplaySink sink(Headless(), rx, metrics);
  flk::StopSource stop;

  std::thread ui([&] { sink.run(stop); });

  Push(*rx);
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (sink.frames_displayed() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }

  stop.request_stop();
  ui.join();
  REQUIRE(sink.frames_displayed() == 1);
}
