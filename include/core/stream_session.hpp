#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "core/frame_encoder.hpp"
#include "core/frame_transport.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

/*
    StreamSession is the sender side state machine.

        Idle --start()--> Probing --probe ok--> Streaming --transport failure / stop()--> Idle
                              \--probe fails--> Idle

    While Streaming, every RawFrame from the capture thread tries to take the single encode slot. If a frame is
    already being encoded or sent, the new one is released immediately (drop-when-busy). There is never more
    than one unit of work (encode + send) in flight, and on_frame() never waits for it.

    The unit of work runs on the session's worker thread. Each streaming cycle gets its own StopSource; stop()
    trips it, and the worker checks it after encoding, before sending and after sending. A request that is
    already on the wire finishes within its timeout, but its outcome no longer touches session state.
*/

namespace flk {

enum class SessionState {
  Idle,
  Probing,
  Streaming,
  Stopping
};

const char* SessionStateName(SessionState s);

// Consistent copy of the session counters, taken under the session lock
struct SessionStatus {
  SessionState state{SessionState::Idle};

  std::uint64_t frames_sent{0};
  std::uint64_t frames_dropped_busy{0};
  std::uint64_t frames_skipped_oversize{0};
  std::uint64_t frames_rejected{0};     // Receiver answered with a non-2xx status
  std::uint64_t encode_failures{0};
  std::uint64_t send_failures{0};       // No response at all

  int last_status{0};
  std::string last_error;
  std::string status_text{"idle"};
};

class StreamSession {
public:
  StreamSession(SessionConfig cfg,
                std::shared_ptr<FrameEncoder> encoder,
                std::shared_ptr<FrameTransport> transport,
                StageMetrics* encode_metrics = nullptr,
                StageMetrics* send_metrics = nullptr);
  ~StreamSession();

  StreamSession(const StreamSession&) = delete;
  StreamSession& operator=(const StreamSession&) = delete;

  // Probe the receiver and enter Streaming. Blocks for the probe only.
  // Returns false if the session was not Idle or the receiver is unreachable
  bool start();

  // Leave Streaming/Probing and cancel the in-flight unit. No-op when Idle
  void stop();

  // Capture thread entry point. Takes the frame and returns right away;
  // false means the frame was released without being processed
  bool on_frame(RawFrame frame);

  SessionState state() const;
  SessionStatus snapshot() const;

  // True while a unit of work holds the encode slot
  bool busy() const { return busy_.load(std::memory_order_acquire); }

  // Wait until the encode slot is free, returns false on timeout
  bool wait_until_idle(std::chrono::milliseconds timeout) const;

private:
  struct Unit {
    RawFrame frame;
    std::shared_ptr<StopSource> cancel;
  };

  void run(const StopToken& global_stop, const std::atomic_bool& local_stop);
  void process(Unit& unit);
  void release_slot();

  SessionConfig cfg_;
  std::shared_ptr<FrameEncoder> encoder_;
  std::shared_ptr<FrameTransport> transport_;
  StageMetrics* encode_metrics_;
  StageMetrics* send_metrics_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;

  SessionState state_{SessionState::Idle};
  std::shared_ptr<StopSource> cycle_;   // Cancellation for the current streaming cycle
  std::optional<Unit> pending_;         // Handoff from on_frame() to the worker, capacity 1
  std::atomic_bool busy_{false};        // The encode slot

  std::uint64_t next_sequence_{0};
  int consecutive_failures_{0};
  SessionStatus status_{};

  ThreadRunner worker_{"stream_session"};
};

} // namespace flk
