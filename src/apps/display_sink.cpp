#include "apps/display_sink.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "core/frame.hpp"

namespace flk {

void ThroughputMeter::on_frame(std::chrono::steady_clock::time_point now) {
  if (!started_) {
    started_ = true;
    window_start_ = now;
    in_window_ = 0;
    return;
  }

  ++in_window_;
  if (in_window_ < window_) return;

  const double dt = std::chrono::duration<double>(now - window_start_).count();
  if (dt > 0.0) fps_ = static_cast<double>(in_window_) / dt;
  in_window_ = 0;
  window_start_ = now;
}

DisplaySink::DisplaySink(DisplayConfig cfg, std::shared_ptr<FrameReceiver> receiver, Metrics& metrics)
    : cfg_(std::move(cfg)), receiver_(std::move(receiver)), metrics_(metrics) {}

bool DisplaySink::poll() {
  receiver_->check_idle(NowEpochMs());

  // Cheap version check first, only take a snapshot when something new was published
  if (receiver_->slot().version() == seen_version_) return false;

  std::uint64_t version = 0;
  auto frame = receiver_->slot().read_latest(version);
  if (!frame || version == seen_version_) return false;

  seen_version_ = version;
  current_ = std::move(frame);
  displayed_.fetch_add(1, std::memory_order_relaxed);
  meter_.on_frame(std::chrono::steady_clock::now());
  return true;
}

std::vector<StatusLine> DisplaySink::status_lines() const {
  const ReceiverStats s = receiver_->stats();

  std::ostringstream fps;
  fps << std::fixed << std::setprecision(1) << meter_.fps();

  std::vector<StatusLine> lines;
  lines.push_back({"Received", std::to_string(s.frame_count)});
  lines.push_back({"Displayed", std::to_string(frames_displayed())});
  lines.push_back({"Decode failures", std::to_string(s.decode_failures), s.decode_failures > 0});
  lines.push_back({"Display FPS", fps.str()});
  if (current_) {
    lines.push_back({"Size", std::to_string(current_->image.cols) + "x" + std::to_string(current_->image.rows)});
    lines.push_back({"Frame", "#" + std::to_string(current_->frame_number) + ", " +
                                  std::to_string(current_->encoded_bytes / 1024) + " KiB"});

    // Capture to arrival, only meaningful when both clocks are in sync
    const std::int64_t transit_ms = current_->received_time_ms - current_->capture_time_ms;
    lines.push_back({"Transit", std::to_string(transit_ms) + " ms", transit_ms > 1000});
  }
  lines.push_back({"Link", s.receiving ? "receiving" : "waiting", !s.receiving});
  return lines;
}

cv::Mat DisplaySink::compose() {
  if (!current_ || current_->image.empty()) {
    cv::Mat waiting(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::putText(waiting, "Waiting for camera stream...", cv::Point(50, 240),
                cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 255, 255), 2, cv::LINE_AA);
    cv::putText(waiting, "Make sure the sender is streaming and the tunnel is up", cv::Point(50, 280),
                cv::FONT_HERSHEY_SIMPLEX, 0.55, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    return waiting;
  }

  // Draw on a copy, the slot's frame is shared with other readers
  cv::Mat canvas = current_->image.clone();
  if (cfg_.show_hud) hud_.draw(canvas, "framelink stream", metrics_, status_lines());

  cv::putText(canvas, "q: quit  s: screenshot", cv::Point(10, canvas.rows - 15),
              cv::FONT_HERSHEY_SIMPLEX, 0.55, cv::Scalar(255, 255, 0), 1, cv::LINE_AA);
  return canvas;
}

std::string DisplaySink::save_screenshot() const {
  if (!current_ || current_->image.empty()) return "";

  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream path;
  path << cfg_.screenshot_dir << "/screenshot_" << std::put_time(&tm, "%Y%m%d_%H%M%S")
       << "_" << current_->frame_number << ".jpg";

  try {
    if (!cv::imwrite(path.str(), current_->image)) {
      std::cerr << "[display_sink] could not write " << path.str() << std::endl;
      return "";
    }
  } catch (const cv::Exception& e) {
    std::cerr << "[display_sink] could not write " << path.str() << ": " << e.what() << std::endl;
    return "";
  }

  std::cout << "[display_sink] screenshot saved: " << path.str() << std::endl;
  return path.str();
}

bool DisplaySink::handle_key(int key) {
  if (key < 0) return true;
  key &= 0xFF;

  if (key == 'q' || key == 27) return false;
  if (key == 's') save_screenshot();
  return true;
}

void DisplaySink::run(StopSource& stop) {
  if (cfg_.enabled) cv::namedWindow(cfg_.window_name, cv::WINDOW_AUTOSIZE);

  while (!stop.stop_requested()) {
    poll();

    if (!cfg_.enabled) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_interval_ms));
      continue;
    }

    cv::imshow(cfg_.window_name, compose());

    // waitKey doubles as the poll interval
    if (!handle_key(cv::waitKey(cfg_.poll_interval_ms))) {
      std::cout << "[display_sink] user exited" << std::endl;
      break;
    }
  }

  stop.request_stop();
  if (cfg_.enabled) cv::destroyWindow(cfg_.window_name);
}

} // namespace flk
