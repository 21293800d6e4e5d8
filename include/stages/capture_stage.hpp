#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace flk {

// Capture source thread. Grabs frames from an OpenCV camera (or draws a synthetic test pattern), converts
// them into planar YUV RawFrames backed by a small buffer pool, and hands each one to the sink.
// A buffer goes back to the pool when the pipeline releases the RawFrame; if none is free the capture is
// skipped, the sink is never waited on.
class CaptureStage final : public Stage {
public:
  using FrameSink = std::function<void(RawFrame)>;

  CaptureStage(StageMetrics* metrics, CameraConfig cfg, FrameSink sink);
  ~CaptureStage() override;

  // Fill a RawFrame from a BGR image. With semi_planar the U and V planes share one interleaved
  // buffer (pixel stride 2, the layout most phone sensors report), otherwise plain I420
  static RawFrame BgrToRawFrame(const cv::Mat& bgr, std::vector<std::uint8_t>& storage, bool semi_planar);

  std::uint64_t frames_skipped() const { return skipped_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  struct Buffer {
    std::vector<std::uint8_t> data;
    std::atomic_bool in_use{false};
  };

  std::shared_ptr<Buffer> acquire_buffer();
  void deliver(const cv::Mat& bgr, bool semi_planar);

  StageMetrics* metrics_;
  CameraConfig cfg_;
  FrameSink sink_;
  std::vector<std::shared_ptr<Buffer>> pool_;
  std::atomic<std::uint64_t> skipped_{0};
};

// Moving color bars, used by the synthetic backend
cv::Mat MakeTestPattern(int width, int height, std::uint64_t tick);

} // namespace flk
