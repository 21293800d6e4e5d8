#include "net/http_frame_transport.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <httplib.h>

namespace flk {

static bool IsSuccessStatus(int status) { return status >= 200 && status < 300; }

HttpFrameTransport::HttpFrameTransport(TransportConfig cfg) : cfg_(std::move(cfg)) {}

bool HttpFrameTransport::probe() {
  try {
    httplib::Client cli(cfg_.host, cfg_.port);
    cli.set_connection_timeout(std::chrono::milliseconds(cfg_.connect_timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(cfg_.probe_read_timeout_ms));

    auto res = cli.Get(cfg_.ping_path);
    if (!res) {
      std::cerr << "[http_transport] probe " << cfg_.host << ":" << cfg_.port << cfg_.ping_path
                << " failed: " << httplib::to_string(res.error()) << std::endl;
      return false;
    }

    if (!IsSuccessStatus(res->status)) {
      std::cerr << "[http_transport] probe answered with status " << res->status << std::endl;
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[http_transport] probe failed: " << e.what() << std::endl;
    return false;
  }
}

TransportResult HttpFrameTransport::send(const EncodedFrame& frame) {
  TransportResult result;

  try {
    httplib::Client cli(cfg_.host, cfg_.port);
    cli.set_connection_timeout(std::chrono::milliseconds(cfg_.connect_timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(cfg_.read_timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(cfg_.write_timeout_ms));

    const httplib::Headers headers{
        {"Frame-Timestamp", std::to_string(frame.capture_time_ms)},
    };

    auto res = cli.Post(cfg_.upload_path, headers,
                        reinterpret_cast<const char*>(frame.bytes.data()), frame.bytes.size(),
                        "image/jpeg");
    if (!res) {
      result.detail = httplib::to_string(res.error());
      return result;
    }

    result.status = res->status;
    result.success = IsSuccessStatus(res->status);
    if (!result.success) result.detail = "receiver answered " + std::to_string(res->status);
  } catch (const std::exception& e) {
    result.success = false;
    result.status = 0;
    result.detail = e.what();
  }

  return result;
}

} // namespace flk
