#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread: the capture loop, the session worker, the HTTP accept loop or the
    dashboard. The worker function gets two things to watch, the process-wide stop token and a flag that only
    this runner sets, and is expected to return soon after either one flips.

    An exception escaping the worker is logged under the runner's name and ends that thread only.
*/

namespace flk {

class ThreadRunner {
public:
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  // Requests a local stop and joins
  ~ThreadRunner();

  // Throws std::runtime_error if a worker is still attached
  void start(StopToken global_stop, Fn fn);

  // Stops this worker only
  void request_stop();
  bool stop_requested() const;

  // Throws std::logic_error when called from the worker itself
  void join();
  bool joinable() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};
};

} // namespace flk
