#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "core/stream_session.hpp"

using namespace std::chrono_literals;

using flk::EncodeResult;
using flk::EncodeStatus;
using flk::RawFrame;
using flk::SessionConfig;
using flk::SessionState;
using flk::StreamSession;
using flk::TransportResult;

namespace {

bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

RawFrame MakeFrame(std::atomic<int>& released, std::int64_t ts = 0) {
  RawFrame f;
  f.format = flk::PixelFormat::Yuv420;
  f.width = 2;
  f.height = 2;
  f.capture_time_ms = ts;
  f.set_release([&released] { released.fetch_add(1); });
  return f;
}

class FakeEncoder final : public flk::FrameEncoder {
public:
  FakeEncoder() : FrameEncoder(flk::EncoderConfig{}) {}

  EncodeResult encode(const RawFrame& frame) override {
    calls.fetch_add(1);
    EncodeResult res;
    res.status = next.load();
    if (res.status == EncodeStatus::Ok) {
      res.frame.bytes = {0xFF, 0xD8, 0xFF, 0xD9};
      res.frame.capture_time_ms = frame.capture_time_ms;
    } else {
      res.error = "fake";
    }
    return res;
  }

  std::atomic<EncodeStatus> next{EncodeStatus::Ok};
  std::atomic<int> calls{0};
};

// Transport whose send() can be held at a gate until the test opens it
class FakeTransport final : public flk::FrameTransport {
public:
  bool probe() override {
    probes.fetch_add(1);
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return probe_open_; });
    }
    return reachable.load();
  }

  TransportResult send(const flk::EncodedFrame& frame) override {
    entered.fetch_add(1);
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return open_; });
      sequences.push_back(frame.sequence_id);
    }
    sends.fetch_add(1);

    TransportResult r;
    r.status = status.load();
    r.success = r.status >= 200 && r.status < 300;
    if (!r.success) r.detail = r.status == 0 ? "connection refused" : "rejected";
    return r;
  }

  void close_gate() {
    std::lock_guard<std::mutex> lock(mu_);
    open_ = false;
  }

  void open_gate() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void close_probe_gate() {
    std::lock_guard<std::mutex> lock(mu_);
    probe_open_ = false;
  }

  void open_probe_gate() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      probe_open_ = true;
    }
    cv_.notify_all();
  }

  std::vector<std::uint64_t> sent_sequences() {
    std::lock_guard<std::mutex> lock(mu_);
    return sequences;
  }

  std::atomic_bool reachable{true};
  std::atomic<int> status{200};
  std::atomic<int> probes{0};
  std::atomic<int> entered{0};
  std::atomic<int> sends{0};

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{true};
  bool probe_open_{true};
  std::vector<std::uint64_t> sequences;
};

struct Fixture {
  explicit Fixture(int max_failures = 1) {
    SessionConfig cfg;
    cfg.max_consecutive_failures = max_failures;
    session = std::make_unique<StreamSession>(cfg, encoder, transport);
  }

  ~Fixture() {
    transport->open_probe_gate();
    transport->open_gate();
    session.reset();
  }

  // Hand one frame over and wait for its unit of work to finish
  bool push(std::atomic<int>& released) {
    const bool taken = session->on_frame(MakeFrame(released));
    REQUIRE(session->wait_until_idle(2000ms));
    return taken;
  }

  std::shared_ptr<FakeEncoder> encoder = std::make_shared<FakeEncoder>();
  std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
  std::unique_ptr<StreamSession> session;
};

} // namespace

TEST_CASE("unreachable receiver keeps the session idle", "[session]") {
  Fixture fx;
  fx.transport->reachable = false;

  REQUIRE_FALSE(fx.session->start());
  REQUIRE(fx.session->state() == SessionState::Idle);
  REQUIRE(fx.transport->probes.load() == 1);

  const auto s = fx.session->snapshot();
  REQUIRE(s.status_text == "connection failed");
  REQUIRE_THAT(s.last_error, Catch::Contains("unreachable"));

  // Frames offered while idle are released, never encoded
  std::atomic<int> released{0};
  REQUIRE_FALSE(fx.session->on_frame(MakeFrame(released)));
  REQUIRE(released.load() == 1);
  REQUIRE(fx.encoder->calls.load() == 0);
}

TEST_CASE("start only works from idle", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());
  REQUIRE(fx.session->state() == SessionState::Streaming);

  REQUIRE_FALSE(fx.session->start());
  REQUIRE(fx.transport->probes.load() == 1);
}

TEST_CASE("each accepted frame is encoded, sent and released", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());

  std::atomic<int> released{0};
  for (int i = 0; i < 3; ++i) REQUIRE(fx.push(released));

  REQUIRE(released.load() == 3);
  REQUIRE(fx.transport->sends.load() == 3);
  REQUIRE(fx.transport->sent_sequences() == std::vector<std::uint64_t>{0, 1, 2});

  const auto s = fx.session->snapshot();
  REQUIRE(s.frames_sent == 3);
  REQUIRE(s.last_status == 200);
  REQUIRE(s.state == SessionState::Streaming);
}

TEST_CASE("frames arriving while busy are dropped right away", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());
  fx.transport->close_gate();

  std::atomic<int> first_released{0};
  std::atomic<int> second_released{0};

  REQUIRE(fx.session->on_frame(MakeFrame(first_released)));
  REQUIRE(WaitFor([&] { return fx.transport->entered.load() == 1; }));

  // Unit 1 is parked inside send(), the next frame must not wait for it
  REQUIRE(fx.session->busy());
  REQUIRE_FALSE(fx.session->on_frame(MakeFrame(second_released)));
  REQUIRE(second_released.load() == 1);

  // The capture buffer of unit 1 went back after encoding, before the send finished
  REQUIRE(first_released.load() == 1);

  fx.transport->open_gate();
  REQUIRE(fx.session->wait_until_idle(2000ms));

  const auto s = fx.session->snapshot();
  REQUIRE(fx.transport->sends.load() == 1);
  REQUIRE(fx.encoder->calls.load() == 1);
  REQUIRE(s.frames_sent == 1);
  REQUIRE(s.frames_dropped_busy == 1);
}

TEST_CASE("oversize frame is skipped and streaming continues", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());

  std::atomic<int> released{0};
  fx.encoder->next = EncodeStatus::TooLarge;
  fx.push(released);

  auto s = fx.session->snapshot();
  REQUIRE(s.state == SessionState::Streaming);
  REQUIRE(s.frames_sent == 0);
  REQUIRE(s.frames_skipped_oversize == 1);
  REQUIRE(fx.transport->entered.load() == 0);
  REQUIRE(released.load() == 1);

  fx.encoder->next = EncodeStatus::Ok;
  fx.push(released);
  s = fx.session->snapshot();
  REQUIRE(s.frames_sent == 1);
}

TEST_CASE("encode failure skips the frame without ending the session", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());

  std::atomic<int> released{0};
  fx.encoder->next = EncodeStatus::Failed;
  fx.push(released);

  const auto s = fx.session->snapshot();
  REQUIRE(s.state == SessionState::Streaming);
  REQUIRE(s.encode_failures == 1);
  REQUIRE(fx.transport->entered.load() == 0);
  REQUIRE(released.load() == 1);
}

TEST_CASE("network failure ends the session", "[session]") {
  SECTION("default budget stops on the first failure") {
    Fixture fx;
    REQUIRE(fx.session->start());
    fx.transport->status = 0;

    std::atomic<int> released{0};
    fx.push(released);

    const auto s = fx.session->snapshot();
    REQUIRE(s.state == SessionState::Idle);
    REQUIRE(s.status_text == "transport error");
    REQUIRE(s.send_failures == 1);
    REQUIRE_THAT(s.last_error, Catch::Contains("connection refused"));

    // Nothing more is accepted until the next start()
    REQUIRE_FALSE(fx.session->on_frame(MakeFrame(released)));
  }

  SECTION("a larger budget tolerates transient failures") {
    Fixture fx(3);
    REQUIRE(fx.session->start());
    fx.transport->status = 0;

    std::atomic<int> released{0};
    fx.push(released);
    fx.push(released);
    REQUIRE(fx.session->state() == SessionState::Streaming);

    // A success resets the streak
    fx.transport->status = 200;
    fx.push(released);
    fx.transport->status = 0;
    fx.push(released);
    fx.push(released);
    REQUIRE(fx.session->state() == SessionState::Streaming);

    fx.push(released);
    REQUIRE(fx.session->state() == SessionState::Idle);
    REQUIRE(fx.session->snapshot().send_failures == 5);
  }
}

TEST_CASE("non-2xx answer counts as rejected and streaming continues", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());
  fx.transport->status = 500;

  std::atomic<int> released{0};
  fx.push(released);

  const auto s = fx.session->snapshot();
  REQUIRE(s.state == SessionState::Streaming);
  REQUIRE(s.frames_rejected == 1);
  REQUIRE(s.frames_sent == 0);
  REQUIRE(s.last_status == 500);
}

TEST_CASE("stop when idle is a no-op", "[session]") {
  Fixture fx;
  const auto before = fx.session->snapshot();

  fx.session->stop();
  fx.session->stop();

  const auto after = fx.session->snapshot();
  REQUIRE(after.state == SessionState::Idle);
  REQUIRE(after.status_text == before.status_text);
  REQUIRE(fx.transport->probes.load() == 0);
}

TEST_CASE("stop cancels the unit in flight", "[session]") {
  Fixture fx;
  REQUIRE(fx.session->start());
  fx.transport->close_gate();

  std::atomic<int> released{0};
  REQUIRE(fx.session->on_frame(MakeFrame(released)));
  REQUIRE(WaitFor([&] { return fx.transport->entered.load() == 1; }));

  fx.session->stop();
  REQUIRE(fx.session->state() == SessionState::Idle);

  // The request completes after stop(), its outcome must not count
  fx.transport->open_gate();
  REQUIRE(fx.session->wait_until_idle(2000ms));

  auto s = fx.session->snapshot();
  REQUIRE(s.state == SessionState::Idle);
  REQUIRE(s.status_text == "stopped");
  REQUIRE(s.frames_sent == 0);

  // A new cycle starts from clean counters
  REQUIRE(fx.session->start());
  fx.push(released);
  s = fx.session->snapshot();
  REQUIRE(s.frames_sent == 1);
  REQUIRE(fx.transport->sent_sequences().back() == 0);
}

TEST_CASE("stop during the probe returns the session to idle", "[session]") {
  Fixture fx;
  fx.transport->close_probe_gate();

  std::atomic_bool done{false};
  std::atomic_bool started{true};
  std::thread starter([&] {
    started = fx.session->start();
    done = true;
  });

  REQUIRE(WaitFor([&] { return fx.session->state() == SessionState::Probing; }));
  REQUIRE(fx.transport->probes.load() == 1);

  fx.session->stop();
  REQUIRE(fx.session->state() == SessionState::Idle);

  // Frames offered after stop() are handed straight back
  std::atomic<int> released{0};
  REQUIRE_FALSE(fx.session->on_frame(MakeFrame(released)));
  REQUIRE(released.load() == 1);

  // The probe answers only now, too late to start streaming
  fx.transport->open_probe_gate();
  starter.join();
  REQUIRE(done.load());
  REQUIRE_FALSE(started.load());
  REQUIRE(fx.session->state() == SessionState::Idle);
  REQUIRE(fx.encoder->calls.load() == 0);

  REQUIRE(fx.session->start());
  REQUIRE(fx.session->state() == SessionState::Streaming);
  REQUIRE(fx.push(released));
  REQUIRE(fx.session->snapshot().frames_sent == 1);
}
