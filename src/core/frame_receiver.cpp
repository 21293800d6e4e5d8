#include "core/frame_receiver.hpp"

#include <climits>
#include <iostream>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "core/frame.hpp"

namespace flk {

FrameReceiver::FrameReceiver(ReceiverConfig cfg, StageMetrics* decode_metrics)
    : cfg_(std::move(cfg)), decode_metrics_(decode_metrics) {
  stats_.start_time_ms = NowEpochMs();
}

void FrameReceiver::ping() {
  std::lock_guard<std::mutex> lock(stats_mu_);
  ++stats_.ping_count;
  stats_.last_ping_ms = NowEpochMs();
}

IngestAck FrameReceiver::ingest(const std::string& body, std::int64_t timestamp_ms) {
  return ingest(reinterpret_cast<const std::uint8_t*>(body.data()), body.size(), timestamp_ms);
}

IngestAck FrameReceiver::ingest(const std::uint8_t* data, std::size_t size, std::int64_t timestamp_ms) {
  IngestAck ack;
  ack.timestamp_ms = timestamp_ms;

  WorkTimer timer(decode_metrics_);

  // Decode outside of any lock, this is the expensive part
  cv::Mat image;
  if (data == nullptr || size == 0) {
    ack.error = "no image data received";
  } else if (size > static_cast<std::size_t>(INT_MAX)) {
    ack.error = "image data too large to decode";
  } else {
    try {
      const cv::Mat buf(1, static_cast<int>(size), CV_8UC1, const_cast<std::uint8_t*>(data));
      image = cv::imdecode(buf, cv::IMREAD_COLOR);
      if (image.empty()) ack.error = "failed to decode image";
    } catch (const cv::Exception& e) {
      ack.error = std::string("failed to decode image: ") + e.what();
      image.release();
    }
  }

  if (image.empty()) {
    {
      std::lock_guard<std::mutex> lock(stats_mu_);
      ++stats_.decode_failures;
      ack.frame_count = stats_.frame_count;
    }
    timer.fail();
    std::cerr << "[frame_receiver] dropping frame (" << size << " bytes): " << ack.error << std::endl;
    return ack;
  }

  auto frame = std::make_shared<DecodedFrame>();
  frame->capture_time_ms = timestamp_ms;
  frame->received_time_ms = NowEpochMs();
  frame->encoded_bytes = size;

  bool new_connection = false;
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    frame->frame_number = ++stats_.frame_count;
    if (!stats_.receiving) {
      stats_.receiving = true;
      ++stats_.connection_count;
      new_connection = true;
    }
    stats_.last_frame_ms = frame->received_time_ms;
    stats_.latest_width = image.cols;
    stats_.latest_height = image.rows;
    stats_.latest_channels = image.channels();
    ack.frame_count = stats_.frame_count;

    // Publish in numbering order so the slot never goes back to an older frame
    frame->image = std::move(image);
    slot_.write(std::shared_ptr<const DecodedFrame>(std::move(frame)));
  }

  if (new_connection) {
    std::cout << "[frame_receiver] sender connected, receiving frames" << std::endl;
  }

  ack.decoded = true;
  return ack;
}

ReceiverStats FrameReceiver::stats() const {
  std::lock_guard<std::mutex> lock(stats_mu_);
  return stats_;
}

bool FrameReceiver::check_idle(std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(stats_mu_);
  if (!stats_.receiving) return false;
  if (now_ms - stats_.last_frame_ms <= cfg_.idle_timeout_ms) return false;

  stats_.receiving = false;
  std::cout << "[frame_receiver] no frame for " << cfg_.idle_timeout_ms << " ms, waiting for sender" << std::endl;
  return true;
}

} // namespace flk
