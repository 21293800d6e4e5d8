#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/capture_stage.hpp"

using namespace std::chrono_literals;

namespace {

flk::CameraConfig Synthetic() {
  flk::CameraConfig cfg;
  cfg.backend = "synthetic";
  cfg.width = 64;
  cfg.height = 48;
  cfg.fps = 200;
  return cfg;
}

bool WaitFor(const std::function<bool()>& pred) {
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

} // namespace

TEST_CASE("BGR image becomes a three plane 4:2:0 frame", "[capture]") {
  const cv::Mat bgr(48, 64, CV_8UC3, cv::Scalar(0, 0, 255));
  std::vector<std::uint8_t> storage;

  SECTION("planar") {
    const flk::RawFrame f = flk::CaptureStage::BgrToRawFrame(bgr, storage, false);
    REQUIRE(f.format == flk::PixelFormat::Yuv420);
    REQUIRE(f.plane_count == 3);
    REQUIRE(f.planes[0].row_stride == 64);
    REQUIRE(f.planes[0].size == 64u * 48u);
    REQUIRE(f.planes[1].row_stride == 32);
    REQUIRE(f.planes[1].pixel_stride == 1);
    REQUIRE(f.planes[2].data == f.planes[1].data + 32 * 24);
  }

  SECTION("semi-planar") {
    const flk::RawFrame f = flk::CaptureStage::BgrToRawFrame(bgr, storage, true);
    REQUIRE(f.planes[1].pixel_stride == 2);
    REQUIRE(f.planes[2].pixel_stride == 2);
    REQUIRE(f.planes[1].row_stride == 64);
    REQUIRE(f.planes[2].data == f.planes[1].data + 1);

    // Pure red: V well above neutral, U below
    REQUIRE(f.planes[2].data[0] > 128);
    REQUIRE(f.planes[1].data[0] < 128);
  }

  REQUIRE(storage.size() == 64u * 48u * 3u / 2u);
}

TEST_CASE("synthetic source delivers frames and gets buffers back", "[capture]") {
  flk::Metrics metrics;
  flk::StopSource stop;
  std::atomic<int> delivered{0};
  std::atomic<int> wrong_size{0};

  // Assertions stay on the test thread, the sink only records
  flk::CaptureStage stage(metrics.make_stage("capture"), Synthetic(), [&](flk::RawFrame f) {
    if (f.width != 64 || f.height != 48) wrong_size.fetch_add(1);
    delivered.fetch_add(1);
    f.release();
  });

  stage.start(stop.token());
  REQUIRE(WaitFor([&] { return delivered.load() >= 10; }));
  stage.stop();

  REQUIRE(wrong_size.load() == 0);

  // Every frame was released, so the pool never ran dry
  REQUIRE(stage.frames_skipped() == 0);
  REQUIRE(metrics.find("capture")->count.load() == static_cast<std::uint64_t>(delivered.load()));
}

TEST_CASE("held buffers make the source skip instead of wait", "[capture]") {
  flk::StopSource stop;
  std::mutex mu;
  std::vector<flk::RawFrame> held;

  flk::CaptureStage stage(nullptr, Synthetic(), [&](flk::RawFrame f) {
    std::lock_guard<std::mutex> lock(mu);
    held.push_back(std::move(f));
  });

  stage.start(stop.token());
  REQUIRE(WaitFor([&] { return stage.frames_skipped() >= 3; }));
  stage.stop();

  {
    std::lock_guard<std::mutex> lock(mu);
    REQUIRE(held.size() == 3);
    held.clear();
  }
}

TEST_CASE("test pattern has the requested size", "[capture]") {
  const cv::Mat img = flk::MakeTestPattern(160, 90, 7);
  REQUIRE(img.cols == 160);
  REQUIRE(img.rows == 90);
  REQUIRE(img.type() == CV_8UC3);
}
