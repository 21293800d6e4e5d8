#include "core/stream_session.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace flk {

const char* SessionStateName(SessionState s) {
  switch (s) {
    case SessionState::Idle: return "idle";
    case SessionState::Probing: return "probing";
    case SessionState::Streaming: return "streaming";
    case SessionState::Stopping: return "stopping";
  }
  return "idle";
}

StreamSession::StreamSession(SessionConfig cfg,
                             std::shared_ptr<FrameEncoder> encoder,
                             std::shared_ptr<FrameTransport> transport,
                             StageMetrics* encode_metrics,
                             StageMetrics* send_metrics)
    : cfg_(std::move(cfg)),
      encoder_(std::move(encoder)),
      transport_(std::move(transport)),
      encode_metrics_(encode_metrics),
      send_metrics_(send_metrics) {
  worker_.start(StopToken{}, [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
}

StreamSession::~StreamSession() {
  stop();
  worker_.request_stop();
  cv_.notify_all();
  worker_.join();
}

bool StreamSession::start() {
  std::shared_ptr<StopSource> cycle;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SessionState::Idle) return false;

    state_ = SessionState::Probing;
    status_.status_text = "testing connection";
    cycle = std::make_shared<StopSource>();
    cycle_ = cycle;
  }

  std::cout << "[stream_session] probing receiver" << std::endl;
  const bool reachable = transport_->probe();

  std::lock_guard<std::mutex> lock(mu_);

  // stop() during the probe already moved us back to Idle
  if (cycle->stop_requested()) return false;

  if (!reachable) {
    state_ = SessionState::Idle;
    cycle_.reset();
    status_.state = state_;
    status_.status_text = "connection failed";
    status_.last_error = "receiver unreachable, liveness probe failed";
    std::cerr << "[stream_session] " << status_.last_error << std::endl;
    return false;
  }

  // A new cycle starts from clean counters
  next_sequence_ = 0;
  consecutive_failures_ = 0;
  status_ = SessionStatus{};
  state_ = SessionState::Streaming;
  status_.state = state_;
  status_.status_text = "streaming";

  std::cout << "[stream_session] streaming started" << std::endl;
  return true;
}

void StreamSession::stop() {
  std::optional<Unit> dropped;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == SessionState::Idle) return;

    state_ = SessionState::Stopping;
    if (cycle_) cycle_->request_stop();
    cycle_.reset();

    // A frame handed over but not yet picked up by the worker never runs
    if (pending_) {
      dropped = std::move(pending_);
      pending_.reset();
      busy_.store(false, std::memory_order_release);
    }

    state_ = SessionState::Idle;
    status_.state = state_;
    status_.status_text = "stopped";
  }
  cv_.notify_all();

  // Release outside the lock, the callback belongs to the capture source
  if (dropped) dropped->frame.release();

  std::cout << "[stream_session] streaming stopped" << std::endl;
}

bool StreamSession::on_frame(RawFrame frame) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != SessionState::Streaming) {
      frame.release();
      return false;
    }

    // Drop-when-busy: non-blocking try-acquire of the single encode slot
    if (busy_.exchange(true, std::memory_order_acq_rel)) {
      ++status_.frames_dropped_busy;
      frame.release();
      return false;
    }

    pending_.emplace(Unit{std::move(frame), cycle_});
  }
  cv_.notify_all();
  return true;
}

SessionState StreamSession::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

SessionStatus StreamSession::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  SessionStatus s = status_;
  s.state = state_;
  return s;
}

bool StreamSession::wait_until_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  return cv_.wait_for(lock, timeout, [&] { return !busy_.load(std::memory_order_acquire); });
}

void StreamSession::release_slot() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    busy_.store(false, std::memory_order_release);
  }
  cv_.notify_all();
}

void StreamSession::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    std::optional<Unit> unit;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, 50ms, [&] {
        return pending_.has_value() || local.load(std::memory_order_relaxed);
      });
      if (!pending_) continue;
      unit = std::move(pending_);
      pending_.reset();
    }

    process(*unit);
    release_slot();
  }
}

void StreamSession::process(Unit& unit) {
  const StopToken cancel = unit.cancel ? unit.cancel->token() : StopToken{};

  // Encode, then hand the capture buffer back right away
  EncodeResult enc;
  {
    WorkTimer timer(encode_metrics_);
    try {
      enc = encoder_->encode(unit.frame);
    } catch (const std::exception& e) {
      enc.status = EncodeStatus::Failed;
      enc.error = e.what();
    }
    if (!enc.ok()) timer.fail();
  }
  unit.frame.release();

  if (cancel.stop_requested()) return;

  if (enc.status == EncodeStatus::TooLarge) {
    std::lock_guard<std::mutex> lock(mu_);
    ++status_.frames_skipped_oversize;
    std::cout << "[stream_session] skipping frame: " << enc.error << std::endl;
    return;
  }

  if (enc.status == EncodeStatus::Failed) {
    std::lock_guard<std::mutex> lock(mu_);
    ++status_.encode_failures;
    status_.last_error = "encode failed: " + enc.error;
    std::cerr << "[stream_session] " << status_.last_error << std::endl;
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (cancel.stop_requested()) return;
    enc.frame.sequence_id = next_sequence_++;
  }

  TransportResult tr;
  {
    WorkTimer timer(send_metrics_);
    try {
      tr = transport_->send(enc.frame);
    } catch (const std::exception& e) {
      tr.success = false;
      tr.status = 0;
      tr.detail = e.what();
    }
    if (!tr.success) timer.fail();
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (cancel.stop_requested()) return;

  status_.last_status = tr.status;

  if (tr.success) {
    ++status_.frames_sent;
    consecutive_failures_ = 0;
    status_.status_text = "streaming";
    return;
  }

  if (!tr.network_error()) {
    // The receiver is up but refused this frame, keep going
    ++status_.frames_rejected;
    consecutive_failures_ = 0;
    status_.last_error = tr.detail;
    std::cerr << "[stream_session] frame " << enc.frame.sequence_id << " rejected: " << tr.detail << std::endl;
    return;
  }

  ++status_.send_failures;
  ++consecutive_failures_;
  status_.last_error = "send failed: " + tr.detail;
  std::cerr << "[stream_session] frame " << enc.frame.sequence_id << " " << status_.last_error
            << " (" << consecutive_failures_ << "/" << cfg_.max_consecutive_failures << ")" << std::endl;

  if (consecutive_failures_ >= cfg_.max_consecutive_failures) {
    if (cycle_) cycle_->request_stop();
    cycle_.reset();
    state_ = SessionState::Idle;
    status_.state = state_;
    status_.status_text = "transport error";
    std::cerr << "[stream_session] streaming ended after transport failure" << std::endl;
  }
}

} // namespace flk
