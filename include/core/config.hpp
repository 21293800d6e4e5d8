#pragma once
#include <cstddef>
#include <string>

namespace flk {

struct CameraConfig {
  std::string backend = "opencv"; // opencv | synthetic
  int device_index = 0;

  int width = 1280;
  int height = 720;
  int fps = 30;

  bool flip_vertical = false;
  bool flip_horizontal = false;
};

struct EncoderConfig {
  int jpeg_quality = 80;
  std::size_t max_frame_bytes = 1024 * 1024;
};

struct TransportConfig {
  std::string host = "127.0.0.1";
  int port = 9001;
  std::string ping_path = "/ping";
  std::string upload_path = "/upload_frame";

  int connect_timeout_ms = 5000;
  int read_timeout_ms = 10000;
  int write_timeout_ms = 10000;
  int probe_read_timeout_ms = 2000;
};

struct SessionConfig {
  // 1 ends the session on the first network failure
  int max_consecutive_failures = 1;
};

struct ReceiverConfig {
  std::string bind_address = "0.0.0.0";
  int port = 9000;
  std::string ping_path = "/ping";
  std::string upload_path = "/upload_frame";
  int idle_timeout_ms = 5000;
};

struct DisplayConfig {
  bool enabled = true;
  std::string window_name = "framelink";
  int poll_interval_ms = 10;
  bool show_hud = true;
  std::string screenshot_dir = ".";
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 1000;
};

struct AppConfig {
  CameraConfig camera{};
  EncoderConfig encoder{};
  TransportConfig transport{};
  SessionConfig session{};
  ReceiverConfig receiver{};
  DisplayConfig display{};
  MetricsConfig metrics{};
};

}
