#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"

/*
    FrameReceiver is the receiving end of the link, independent of HTTP (ReceiverServer binds it).

    ingest() decodes the JPEG on the caller's thread and publishes it in the current-frame slot. A payload
    that does not decode is counted and dropped, but the call still acknowledges it so the sender's
    request/response cycle is never broken by a bad frame.
*/

namespace flk {

struct DecodedFrame {
  cv::Mat image;                      // BGR
  std::uint64_t frame_number{0};      // Value of the cumulative counter when this frame arrived
  std::int64_t capture_time_ms{0};    // From the sender
  std::int64_t received_time_ms{0};
  std::size_t encoded_bytes{0};
};

struct IngestAck {
  bool decoded{false};
  std::uint64_t frame_count{0};
  std::int64_t timestamp_ms{0};
  std::string error;
};

struct ReceiverStats {
  std::uint64_t frame_count{0};
  std::uint64_t decode_failures{0};
  std::uint64_t ping_count{0};
  std::uint64_t connection_count{0};

  bool receiving{false};
  std::int64_t start_time_ms{0};
  std::int64_t last_frame_ms{0};     // 0 until the first frame
  std::int64_t last_ping_ms{0};      // 0 until the first ping

  int latest_width{0};
  int latest_height{0};
  int latest_channels{0};
};

class FrameReceiver {
public:
  explicit FrameReceiver(ReceiverConfig cfg, StageMetrics* decode_metrics = nullptr);

  FrameReceiver(const FrameReceiver&) = delete;
  FrameReceiver& operator=(const FrameReceiver&) = delete;

  // Liveness bookkeeping, the probe itself always succeeds
  void ping();

  IngestAck ingest(const std::uint8_t* data, std::size_t size, std::int64_t timestamp_ms);
  IngestAck ingest(const std::string& body, std::int64_t timestamp_ms);

  // Most recent decoded frame, null before the first one
  LatestStore<DecodedFrame>::Ptr current_frame() const { return slot_.read_latest(); }
  const LatestStore<DecodedFrame>& slot() const { return slot_; }

  ReceiverStats stats() const;

  // Clear the receiving flag once no frame arrived for idle_timeout_ms. Returns true when it flips
  bool check_idle(std::int64_t now_ms);

  const ReceiverConfig& config() const { return cfg_; }

private:
  ReceiverConfig cfg_;
  StageMetrics* decode_metrics_;

  LatestStore<DecodedFrame> slot_;

  mutable std::mutex stats_mu_;
  ReceiverStats stats_{};
};

} // namespace flk
