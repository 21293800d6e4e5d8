#pragma once
#include <atomic>

/*
    StopToken / StopSource is a small utility for cooperative shutdown and cancellation.

    A StopSource owns the flag. The apps own one for the whole process (SIGINT, 'q' key), and StreamSession
    creates a fresh one for every streaming cycle so stop() can cancel the unit of work that is in flight.

    A StopToken is a read-only view into a StopSource. The StopSource must outlive every token taken from it.
*/

namespace flk {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  // Same method names as ThreadRunner to keep uniformity between StopSource and ThreadRunner
  void request_stop() { stop_.store(true, std::memory_order_release); }

  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }

private:
  std::atomic_bool stop_{false};
};

} // namespace flk
