#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "apps/ansi_dashboard.hpp"
#include "core/config_loader.hpp"
#include "core/frame_encoder.hpp"
#include "core/stream_session.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"
#include "net/http_frame_transport.hpp"
#include "stages/capture_stage.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// frame_sender.cpp is the capture side of the link
// Probes the receiver, then streams camera frames until SIGINT or until the session ends on a transport error

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    flk::AppConfig cfg = flk::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);

    flk::StopSource global_stop;

    flk::Metrics metrics;
    flk::StageMetrics* capture_metrics = metrics.make_stage("capture");
    flk::StageMetrics* encode_metrics = metrics.make_stage("encode");
    flk::StageMetrics* send_metrics = metrics.make_stage("send");

    auto encoder = std::make_shared<flk::FrameEncoder>(cfg.encoder);
    auto transport = std::make_shared<flk::HttpFrameTransport>(cfg.transport);
    flk::StreamSession session(cfg.session, encoder, transport, encode_metrics, send_metrics);

    std::cout << "Target receiver: http://" << cfg.transport.host << ":" << cfg.transport.port
              << cfg.transport.upload_path << std::endl;

    if (!session.start()) {
      const flk::SessionStatus s = session.snapshot();
      std::cerr << "Cannot start streaming: " << s.last_error << " (http://" << cfg.transport.host << ":"
                << cfg.transport.port << cfg.transport.ping_path << ")" << std::endl;
      return 1;
    }

    flk::CaptureStage capture_stage(capture_metrics, cfg.camera, [&session](flk::RawFrame f) {
      session.on_frame(std::move(f));
    });

    flk::ThreadRunner dashboard_runner("dashboard");
    if (cfg.metrics.enable_console_log) {
      auto dashboard = std::make_shared<flk::AnsiDashboard>(
          "FRAMELINK SENDER", metrics,
          [&session]() {
            const flk::SessionStatus s = session.snapshot();
            std::vector<flk::StatusLine> lines;
            lines.push_back({"State", flk::SessionStateName(s.state), s.state != flk::SessionState::Streaming});
            lines.push_back({"Status", s.status_text});
            lines.push_back({"Frames sent", std::to_string(s.frames_sent)});
            lines.push_back({"Dropped (busy)", std::to_string(s.frames_dropped_busy)});
            lines.push_back({"Skipped (size)", std::to_string(s.frames_skipped_oversize)});
            lines.push_back({"Rejected", std::to_string(s.frames_rejected), s.frames_rejected > 0});
            lines.push_back({"Encode failures", std::to_string(s.encode_failures), s.encode_failures > 0});
            lines.push_back({"Last HTTP status", std::to_string(s.last_status)});
            lines.push_back({"Last error", s.last_error.empty() ? "-" : s.last_error, !s.last_error.empty()});
            return lines;
          },
          cfg.metrics.log_interval_ms);

      dashboard_runner.start(global_stop.token(), [dashboard](const flk::StopToken& g, const std::atomic_bool& l) {
        dashboard->run(g, l);
      });
    }

    capture_stage.start(global_stop.token());

    bool transport_failed = false;
    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        std::cout << "\nStopping stream..." << std::endl;
        global_stop.request_stop();
        break;
      }

      // No automatic reconnect, a transport error ends the run
      if (session.state() == flk::SessionState::Idle) {
        std::cerr << "Streaming ended: " << session.snapshot().last_error << std::endl;
        transport_failed = true;
        global_stop.request_stop();
        break;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // Stop the producer first, then the session
    capture_stage.stop();
    session.stop();
    dashboard_runner.request_stop();
    dashboard_runner.join();

    const flk::SessionStatus s = session.snapshot();
    std::cout << "Frames sent: " << s.frames_sent << ", dropped while busy: " << s.frames_dropped_busy
              << ", skipped oversize: " << s.frames_skipped_oversize << std::endl;

    if (transport_failed) return 1;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
