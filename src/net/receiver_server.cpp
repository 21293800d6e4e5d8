#include "net/receiver_server.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <httplib.h>

#include "core/frame.hpp"

namespace flk {

static constexpr const char* kStatusPath = "/status";
static constexpr const char* kShutdownPath = "/shutdown";

static std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) out += ' ';
        else out += c;
    }
  }
  return out;
}

// Frame-Timestamp header in ms since epoch, falls back to the arrival time
static std::int64_t ParseTimestamp(const httplib::Request& req) {
  const std::string raw = req.get_header_value("Frame-Timestamp");
  if (raw.empty()) return NowEpochMs();

  char* end = nullptr;
  const long long v = std::strtoll(raw.c_str(), &end, 10);
  if (end == raw.c_str() || *end != '\0' || v < 0) return NowEpochMs();
  return static_cast<std::int64_t>(v);
}

ReceiverServer::ReceiverServer(ReceiverConfig cfg, std::shared_ptr<FrameReceiver> receiver)
    : Stage("receiver_server"),
      cfg_(std::move(cfg)),
      receiver_(std::move(receiver)),
      svr_(std::make_unique<httplib::Server>()) {
  register_routes();
}

ReceiverServer::~ReceiverServer() {
  stop();

  // Bound but never started
  close_unserved();
}

std::string ReceiverServer::StatusJson(const ReceiverStats& stats, std::int64_t now_ms) {
  const double elapsed_s = static_cast<double>(now_ms - stats.start_time_ms) / 1000.0;
  const double fps = elapsed_s > 0.0 ? static_cast<double>(stats.frame_count) / elapsed_s : 0.0;

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2)
      << "{\"frame_count\":" << stats.frame_count
      << ",\"decode_failures\":" << stats.decode_failures
      << ",\"connection_count\":" << stats.connection_count
      << ",\"ping_count\":" << stats.ping_count
      << ",\"elapsed_time\":" << elapsed_s
      << ",\"fps\":" << fps
      << ",\"is_receiving\":" << (stats.receiving ? "true" : "false")
      << ",\"latest_frame_shape\":";
  if (stats.latest_width > 0) {
    oss << "[" << stats.latest_height << "," << stats.latest_width << "," << stats.latest_channels << "]";
  } else {
    oss << "null";
  }
  oss << "}";
  return oss.str();
}

void ReceiverServer::register_routes() {
  svr_->Get(cfg_.ping_path, [this](const httplib::Request&, httplib::Response& res) {
    receiver_->ping();
    res.set_content("{\"status\":\"ok\",\"message\":\"framelink receiver is running\"}", "application/json");
  });

  svr_->Post(cfg_.upload_path, [this](const httplib::Request& req, httplib::Response& res) {
    const IngestAck ack = receiver_->ingest(req.body, ParseTimestamp(req));

    // Decode failures are still acknowledged, the sender keeps streaming
    std::ostringstream oss;
    oss << "{\"status\":\"" << (ack.decoded ? "success" : "skipped") << "\""
        << ",\"frame_count\":" << ack.frame_count
        << ",\"timestamp\":" << ack.timestamp_ms;
    if (!ack.decoded) oss << ",\"error\":\"" << JsonEscape(ack.error) << "\"";
    oss << "}";
    res.set_content(oss.str(), "application/json");
  });

  svr_->Get(kStatusPath, [this](const httplib::Request&, httplib::Response& res) {
    res.set_content(StatusJson(receiver_->stats(), NowEpochMs()), "application/json");
  });

  svr_->Get(kShutdownPath, [this](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"message\":\"Server shutdown initiated\"}", "application/json");
    if (on_shutdown_) on_shutdown_();
  });
}

int ReceiverServer::bind() {
  if (bound_port_ > 0) return bound_port_;

  if (cfg_.port == 0) {
    bound_port_ = svr_->bind_to_any_port(cfg_.bind_address);
  } else if (svr_->bind_to_port(cfg_.bind_address, cfg_.port)) {
    bound_port_ = cfg_.port;
  }

  if (bound_port_ <= 0) {
    bound_port_ = -1;
    throw std::runtime_error("receiver_server: cannot bind " + cfg_.bind_address + ":" + std::to_string(cfg_.port));
  }

  listen_.store(Listen::Bound);
  std::cout << "[receiver_server] listening on " << cfg_.bind_address << ":" << bound_port_
            << " (" << cfg_.ping_path << ", " << cfg_.upload_path << ")" << std::endl;
  return bound_port_;
}

void ReceiverServer::run(const StopToken& global, const std::atomic_bool& local) {
  if (bound_port_ <= 0) {
    std::cerr << "[receiver_server] start() called before bind()" << std::endl;
    return;
  }

  if (global.stop_requested() || local.load(std::memory_order_relaxed)) return;

  // Loses to interrupt() if it already gave up on this socket
  Listen expected = Listen::Bound;
  if (!listen_.compare_exchange_strong(expected, Listen::Serving)) return;

  // Blocks until interrupt() stops the server
  if (!svr_->listen_after_bind() && !local.load(std::memory_order_relaxed)) {
    std::cerr << "[receiver_server] listen loop ended unexpectedly" << std::endl;
  }
}

void ReceiverServer::interrupt() {
  using namespace std::chrono_literals;

  if (close_unserved()) return;
  if (listen_.load() != Listen::Serving) return;

  // stop() is a no-op until the accept loop is up, give it a moment to get there
  for (int i = 0; i < 200 && !svr_->is_running(); ++i) {
    std::this_thread::sleep_for(5ms);
  }
  svr_->stop();
  listen_.store(Listen::Closed);
}

bool ReceiverServer::close_unserved() {
  using namespace std::chrono_literals;

  Listen expected = Listen::Bound;
  if (!listen_.compare_exchange_strong(expected, Listen::Closed)) return false;

  // httplib only closes its socket from stop() on a running server, so bring the loop up and stop it at once
  std::atomic_bool done{false};
  std::thread drain([this, &done] {
    svr_->listen_after_bind();
    done.store(true);
  });
  while (!svr_->is_running() && !done.load()) std::this_thread::sleep_for(1ms);
  svr_->stop();
  drain.join();

  std::cout << "[receiver_server] closed unserved port " << bound_port_ << std::endl;
  return true;
}

} // namespace flk
