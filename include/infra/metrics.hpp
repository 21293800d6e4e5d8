#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/*
  Metrics owns one StageMetrics per unit of work we want to watch (capture, encode, send, decode). Each
  StageMetrics is updated lock-free by the thread doing the work and read by the ANSI dashboard and the
  display overlay through snapshot(). WorkTimer wraps one unit of work and records it when it goes out of scope.
*/

namespace flk {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

// Plain copy of one stage's counters
struct StageSnapshot {
  std::string name;
  std::uint64_t count{0};
  std::uint64_t failures{0};
  std::uint64_t avg_latency_ns{0};
  std::uint64_t work_ns_total{0};
  std::uint64_t last_event_ns{0};
};

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> count{0};
  std::atomic<std::uint64_t> failures{0};        // Units the stage gave up on
  std::atomic<std::uint64_t> avg_latency_ns{0};  // EWMA, 1/8 weight for the newest sample
  std::atomic<std::uint64_t> work_ns_total{0};
  std::atomic<std::uint64_t> last_event_ns{0};

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_item(std::uint64_t latency_ns) {
    count.fetch_add(1, std::memory_order_relaxed);

    const auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    avg_latency_ns.store(prev == 0 ? latency_ns : (prev * 7 + latency_ns) / 8, std::memory_order_relaxed);

    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_failure(std::uint64_t latency_ns = 0) {
    failures.fetch_add(1, std::memory_order_relaxed);
    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  StageSnapshot snapshot() const {
    StageSnapshot s;
    s.name = name;
    s.count = count.load(std::memory_order_relaxed);
    s.failures = failures.load(std::memory_order_relaxed);
    s.avg_latency_ns = avg_latency_ns.load(std::memory_order_relaxed);
    s.work_ns_total = work_ns_total.load(std::memory_order_relaxed);
    s.last_event_ns = last_event_ns.load(std::memory_order_relaxed);
    return s;
  }
};

// Times one unit of work. Counts as an item on destruction unless fail() was called. Null metrics is allowed
class WorkTimer {
public:
  explicit WorkTimer(StageMetrics* metrics) : metrics_(metrics), start_ns_(metrics ? NowNs() : 0) {}

  ~WorkTimer() {
    if (!metrics_) return;
    const std::uint64_t elapsed = NowNs() - start_ns_;
    if (failed_) metrics_->on_failure(elapsed);
    else metrics_->on_item(elapsed);
  }

  WorkTimer(const WorkTimer&) = delete;
  WorkTimer& operator=(const WorkTimer&) = delete;

  void fail() { failed_ = true; }

private:
  StageMetrics* metrics_;
  std::uint64_t start_ns_;
  bool failed_{false};
};

// Stages are registered once at startup, before any worker thread runs
class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  // Null when no stage has that name
  StageMetrics* find(const std::string& name) const {
    for (const auto& s : stages_) {
      if (s->name == name) return s.get();
    }
    return nullptr;
  }

  std::vector<StageSnapshot> snapshot() const {
    std::vector<StageSnapshot> out;
    out.reserve(stages_.size());
    for (const auto& s : stages_) out.push_back(s->snapshot());
    return out;
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace flk
