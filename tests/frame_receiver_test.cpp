#include <catch2/catch.hpp>

#include <atomic>
#include <climits>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "core/frame_receiver.hpp"
#include "infra/metrics.hpp"

using flk::FrameReceiver;
using flk::ReceiverConfig;

namespace {

std::vector<std::uint8_t> SolidJpeg(int w, int h, const cv::Scalar& bgr) {
  std::vector<std::uint8_t> out;
  cv::imencode(".jpg", cv::Mat(h, w, CV_8UC3, bgr), out);
  return out;
}

} // namespace

TEST_CASE("valid frame is decoded and published", "[receiver]") {
  flk::Metrics metrics;
  FrameReceiver rx(ReceiverConfig{}, metrics.make_stage("decode"));
  REQUIRE(rx.current_frame() == nullptr);

  const auto jpeg = SolidJpeg(64, 48, cv::Scalar(10, 200, 30));
  const auto ack = rx.ingest(jpeg.data(), jpeg.size(), 1700000000123);

  REQUIRE(ack.decoded);
  REQUIRE(ack.frame_count == 1);
  REQUIRE(ack.timestamp_ms == 1700000000123);

  auto frame = rx.current_frame();
  REQUIRE(frame);
  REQUIRE(frame->image.cols == 64);
  REQUIRE(frame->image.rows == 48);
  REQUIRE(frame->image.channels() == 3);
  REQUIRE(frame->frame_number == 1);
  REQUIRE(frame->capture_time_ms == 1700000000123);
  REQUIRE(frame->encoded_bytes == jpeg.size());

  const auto s = rx.stats();
  REQUIRE(s.frame_count == 1);
  REQUIRE(s.receiving);
  REQUIRE(s.connection_count == 1);
  REQUIRE(s.latest_width == 64);
  REQUIRE(s.latest_height == 48);
  REQUIRE(metrics.find("decode")->count.load() == 1);
}

TEST_CASE("frame counter grows by one per decoded frame", "[receiver]") {
  FrameReceiver rx(ReceiverConfig{});
  const auto jpeg = SolidJpeg(32, 32, cv::Scalar(0, 0, 255));

  for (std::uint64_t i = 1; i <= 5; ++i) {
    const auto ack = rx.ingest(jpeg.data(), jpeg.size(), 0);
    REQUIRE(ack.frame_count == i);
    REQUIRE(rx.current_frame()->frame_number == i);
  }
}

TEST_CASE("corrupt payload is acknowledged and leaves the current frame alone", "[receiver]") {
  flk::Metrics metrics;
  FrameReceiver rx(ReceiverConfig{}, metrics.make_stage("decode"));

  const auto jpeg = SolidJpeg(32, 32, cv::Scalar(255, 0, 0));
  REQUIRE(rx.ingest(jpeg.data(), jpeg.size(), 5).decoded);
  const auto before = rx.current_frame();

  SECTION("garbage bytes") {
    const std::string garbage(2048, '\x42');
    const auto ack = rx.ingest(garbage, 6);
    REQUIRE_FALSE(ack.decoded);
    REQUIRE_FALSE(ack.error.empty());
    REQUIRE(ack.frame_count == 1);
  }

  SECTION("truncated jpeg header") {
    const auto ack = rx.ingest(jpeg.data(), 16, 6);
    REQUIRE_FALSE(ack.decoded);
  }

  SECTION("empty body") {
    const auto ack = rx.ingest(std::string(), 6);
    REQUIRE_FALSE(ack.decoded);
    REQUIRE(ack.error == "no image data received");
  }

  const auto s = rx.stats();
  REQUIRE(s.frame_count == 1);
  REQUIRE(s.decode_failures == 1);
  REQUIRE(rx.current_frame() == before);
  REQUIRE(metrics.find("decode")->failures.load() == 1);
}

TEST_CASE("receiving flag clears after the idle timeout", "[receiver]") {
  ReceiverConfig cfg;
  cfg.idle_timeout_ms = 100;
  FrameReceiver rx(cfg);

  REQUIRE_FALSE(rx.check_idle(flk::NowEpochMs()));

  const auto jpeg = SolidJpeg(16, 16, cv::Scalar(1, 2, 3));
  rx.ingest(jpeg.data(), jpeg.size(), 0);
  const auto last = rx.stats().last_frame_ms;

  REQUIRE_FALSE(rx.check_idle(last + 50));
  REQUIRE(rx.check_idle(last + 101));
  REQUIRE_FALSE(rx.stats().receiving);
  REQUIRE_FALSE(rx.check_idle(last + 500));

  // Next frame counts as a new connection
  rx.ingest(jpeg.data(), jpeg.size(), 0);
  REQUIRE(rx.stats().receiving);
  REQUIRE(rx.stats().connection_count == 2);
}

TEST_CASE("ping is counted", "[receiver]") {
  FrameReceiver rx(ReceiverConfig{});
  rx.ping();
  rx.ping();
  const auto s = rx.stats();
  REQUIRE(s.ping_count == 2);
  REQUIRE(s.last_ping_ms > 0);
}

TEST_CASE("concurrent ingest keeps an exact count", "[receiver]") {
  FrameReceiver rx(ReceiverConfig{});
  const auto jpeg = SolidJpeg(32, 24, cv::Scalar(50, 60, 70));

  std::vector<std::thread> senders;
  for (int t = 0; t < 4; ++t) {
    senders.emplace_back([&] {
      for (int i = 0; i < 25; ++i) rx.ingest(jpeg.data(), jpeg.size(), 0);
    });
  }
  for (auto& t : senders) t.join();

  REQUIRE(rx.stats().frame_count == 100);
  REQUIRE(rx.slot().version() == 100);

  // The slot ends on the highest numbered frame, never an older one
  REQUIRE(rx.current_frame()->frame_number == 100);
}

TEST_CASE("body larger than a decoder buffer is refused up front", "[receiver]") {
  FrameReceiver rx(ReceiverConfig{});
  const auto jpeg = SolidJpeg(16, 16, cv::Scalar(9, 9, 9));

  // Only the length is oversized, the bytes are never touched
  const std::size_t huge = static_cast<std::size_t>(INT_MAX) + 1;
  const auto ack = rx.ingest(jpeg.data(), huge, 0);

  REQUIRE_FALSE(ack.decoded);
  REQUIRE(ack.error == "image data too large to decode");
  REQUIRE(rx.stats().decode_failures == 1);
  REQUIRE(rx.current_frame() == nullptr);
}
