#include "stages/capture_stage.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace flk {

// Enough for one frame in flight plus the one being captured
static constexpr std::size_t kPoolSize = 3;

cv::Mat MakeTestPattern(int width, int height, std::uint64_t tick) {
  static const cv::Scalar kBars[] = {
      cv::Scalar(255, 255, 255), cv::Scalar(0, 255, 255), cv::Scalar(255, 255, 0), cv::Scalar(0, 255, 0),
      cv::Scalar(255, 0, 255),   cv::Scalar(0, 0, 255),   cv::Scalar(255, 0, 0),   cv::Scalar(0, 0, 0),
  };
  constexpr int kBarCount = static_cast<int>(sizeof(kBars) / sizeof(kBars[0]));

  cv::Mat img(height, width, CV_8UC3);
  const int bar_w = std::max(1, width / kBarCount);
  const int shift = static_cast<int>(tick % static_cast<std::uint64_t>(width));

  for (int i = 0; i < kBarCount + 1; ++i) {
    const int x = (i * bar_w + shift) % width;
    const int w = std::min(bar_w, width - x);
    img(cv::Rect(x, 0, w, height)).setTo(kBars[i % kBarCount]);
  }

  cv::putText(img, "framelink #" + std::to_string(tick), cv::Point(10, height - 20),
              cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 0, 0), 2, cv::LINE_AA);
  return img;
}

RawFrame CaptureStage::BgrToRawFrame(const cv::Mat& bgr, std::vector<std::uint8_t>& storage, bool semi_planar) {
  const int w = bgr.cols;
  const int h = bgr.rows;
  const std::size_t y_size = static_cast<std::size_t>(w) * h;
  const std::size_t c_size = y_size / 4;

  cv::Mat i420;
  cv::cvtColor(bgr, i420, cv::COLOR_BGR2YUV_I420);
  storage.resize(y_size + 2 * c_size);

  RawFrame f;
  f.format = PixelFormat::Yuv420;
  f.width = w;
  f.height = h;
  f.plane_count = 3;
  f.capture_time_ms = NowEpochMs();

  const std::uint8_t* src = i420.ptr<std::uint8_t>();
  std::memcpy(storage.data(), src, y_size);
  f.planes[0] = Plane{storage.data(), y_size, w, 1};

  if (!semi_planar) {
    std::memcpy(storage.data() + y_size, src + y_size, 2 * c_size);
    f.planes[1] = Plane{storage.data() + y_size, c_size, w / 2, 1};
    f.planes[2] = Plane{storage.data() + y_size + c_size, c_size, w / 2, 1};
    return f;
  }

  // Interleave U,V into one buffer; each plane view steps over the other's samples
  std::uint8_t* uv = storage.data() + y_size;
  const std::uint8_t* u = src + y_size;
  const std::uint8_t* v = src + y_size + c_size;
  for (std::size_t i = 0; i < c_size; ++i) {
    uv[2 * i] = u[i];
    uv[2 * i + 1] = v[i];
  }
  f.planes[1] = Plane{uv, 2 * c_size - 1, w, 2};
  f.planes[2] = Plane{uv + 1, 2 * c_size - 1, w, 2};
  return f;
}

CaptureStage::CaptureStage(StageMetrics* metrics, CameraConfig cfg, FrameSink sink)
    : Stage("capture_stage"), metrics_(metrics), cfg_(std::move(cfg)), sink_(std::move(sink)) {
  for (std::size_t i = 0; i < kPoolSize; ++i) pool_.push_back(std::make_shared<Buffer>());
}

CaptureStage::~CaptureStage() {
  stop();
}

std::shared_ptr<CaptureStage::Buffer> CaptureStage::acquire_buffer() {
  for (auto& b : pool_) {
    bool expected = false;
    if (b->in_use.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return b;
  }
  return nullptr;
}

void CaptureStage::deliver(const cv::Mat& bgr, bool semi_planar) {
  std::shared_ptr<Buffer> buf = acquire_buffer();
  if (!buf) {
    skipped_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) metrics_->on_failure();
    return;
  }

  WorkTimer timer(metrics_);

  RawFrame f = BgrToRawFrame(bgr, buf->data, semi_planar);
  // The lambda keeps the buffer alive until the pipeline hands it back
  f.set_release([buf]() { buf->in_use.store(false, std::memory_order_release); });

  sink_(std::move(f));
}

void CaptureStage::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  if (cfg_.backend == "synthetic") {
    const auto period = std::chrono::microseconds(1000000 / cfg_.fps);
    auto next = std::chrono::steady_clock::now();
    std::uint64_t tick = 0;

    while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
      deliver(MakeTestPattern(cfg_.width, cfg_.height, tick), true);
      tick += 4;

      next += period;
      std::this_thread::sleep_until(next);
    }
    return;
  }

  cv::VideoCapture cap(cfg_.device_index);

  // On failure the camera doesn't open, log and leave the rest of the process alive
  if (!cap.isOpened()) {
    std::cerr << "[capture_stage] cannot open camera " << cfg_.device_index << std::endl;
    return;
  }

  cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  cap.set(cv::CAP_PROP_FPS, cfg_.fps);

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    cv::Mat img;

    // Read one frame from capture, if unable, try again
    if (!cap.read(img) || img.empty()) {
      std::this_thread::sleep_for(5ms);
      continue;
    }

    if (cfg_.flip_vertical) cv::flip(img, img, 0);
    if (cfg_.flip_horizontal) cv::flip(img, img, 1);

    // 4:2:0 needs even dimensions, trim the odd row/column if the driver gave us one
    if ((img.cols % 2) != 0 || (img.rows % 2) != 0) {
      img = img(cv::Rect(0, 0, img.cols & ~1, img.rows & ~1)).clone();
    }

    deliver(img, false);
  }
}

} // namespace flk
