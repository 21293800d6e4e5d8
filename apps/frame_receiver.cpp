#include <iostream>

#include <atomic>
#include <csignal>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "apps/ansi_dashboard.hpp"
#include "apps/display_sink.hpp"
#include "core/config_loader.hpp"
#include "core/frame.hpp"
#include "core/frame_receiver.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"
#include "net/receiver_server.hpp"

static flk::StopSource g_stop;

static void HandleSigint(int) {
  g_stop.request_stop();
}

static std::string Ago(std::int64_t then_ms, std::int64_t now_ms) {
  if (then_ms == 0) return "never";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << static_cast<double>(now_ms - then_ms) / 1000.0 << "s ago";
  return oss.str();
}

// frame_receiver.cpp is the viewing side of the link
// Serves /ping and /upload_frame, shows the newest frame in a window and prints a status report

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    flk::AppConfig cfg = flk::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);

    flk::Metrics metrics;
    flk::StageMetrics* decode_metrics = metrics.make_stage("decode");

    auto receiver = std::make_shared<flk::FrameReceiver>(cfg.receiver, decode_metrics);

    flk::ReceiverServer server(cfg.receiver, receiver);
    server.set_shutdown_handler([] { g_stop.request_stop(); });
    server.bind();
    server.start(g_stop.token());

    flk::ThreadRunner dashboard_runner("dashboard");
    if (cfg.metrics.enable_console_log) {
      const int port = server.port();
      auto dashboard = std::make_shared<flk::AnsiDashboard>(
          "FRAMELINK RECEIVER", metrics,
          [receiver, port]() {
            const flk::ReceiverStats s = receiver->stats();
            const std::int64_t now = flk::NowEpochMs();
            const std::int64_t up_s = (now - s.start_time_ms) / 1000;

            std::ostringstream uptime;
            uptime << std::setfill('0') << std::setw(2) << up_s / 3600 << ":"
                   << std::setw(2) << (up_s % 3600) / 60 << ":" << std::setw(2) << up_s % 60;

            std::vector<flk::StatusLine> lines;
            lines.push_back({"Uptime", uptime.str()});
            lines.push_back({"Port", std::to_string(port)});
            lines.push_back({"Link", s.receiving ? "receiving" : "waiting for sender", !s.receiving});
            lines.push_back({"Frames received", std::to_string(s.frame_count)});
            lines.push_back({"Decode failures", std::to_string(s.decode_failures), s.decode_failures > 0});
            lines.push_back({"Connections", std::to_string(s.connection_count)});
            lines.push_back({"Last frame", Ago(s.last_frame_ms, now)});
            lines.push_back({"Last ping", Ago(s.last_ping_ms, now)});
            return lines;
          },
          cfg.metrics.log_interval_ms);

      dashboard_runner.start(g_stop.token(), [dashboard](const flk::StopToken& g, const std::atomic_bool& l) {
        dashboard->run(g, l);
      });
    }

    // UI stays on the main thread, returns on 'q', SIGINT or /shutdown
    flk::DisplaySink display(cfg.display, receiver, metrics);
    display.run(g_stop);

    std::cout << "Shutting down receiver..." << std::endl;
    server.stop();
    dashboard_runner.request_stop();
    dashboard_runner.join();

    const flk::ReceiverStats s = receiver->stats();
    std::cout << "Frames received: " << s.frame_count << ", displayed: " << display.frames_displayed()
              << ", decode failures: " << s.decode_failures << std::endl;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
