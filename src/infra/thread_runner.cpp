#include "infra/thread_runner.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace flk {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
  else thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_release);
  global_stop_ = global_stop;

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    // An escaping exception would terminate the process, report it and let the thread end instead
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] worker ended with exception: " << e.what() << std::endl;
    }
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_release);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_acquire);
}

// Joining from the worker itself would deadlock
void ThreadRunner::join() {
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    throw std::logic_error("ThreadRunner '" + name_ + "' cannot join itself");
  }
  thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace flk
