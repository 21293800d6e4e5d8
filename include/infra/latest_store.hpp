#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

/*
    LatestStore is the receiver's current-frame slot.

    The ingest handler decodes a frame on its own request thread and then publishes it here, replacing
    whatever was there. There is no history and no queue: readers (the display sink, /status) only ever see
    the most recent value. This is what keeps the receiver real-time; a slow display just skips frames
    instead of building a backlog.

    Values are held as shared_ptr<const T>. The exclusive lock is held only for the pointer swap, so the
    expensive work (decode) happens outside it, and a reader keeps its snapshot alive after the next swap.
    The version counter lets a poller cheaply tell whether anything new arrived.
*/

namespace flk {

template <typename T>
class LatestStore {
public:
  using Ptr = std::shared_ptr<const T>;

  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  // Publish a new value, returns the version it was stored under
  std::uint64_t write(Ptr value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    latest_.swap(value);
    return ++version_;
  }

  std::uint64_t write(T value) {
    return write(std::make_shared<const T>(std::move(value)));
  }

  // Snapshot of the current value, null if nothing was written yet
  Ptr read_latest() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return latest_;
  }

  // Snapshot together with the version it belongs to
  Ptr read_latest(std::uint64_t& version) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    version = version_;
    return latest_;
  }

  std::uint64_t version() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return latest_ != nullptr;
  }

private:
  mutable std::shared_mutex mu_;
  Ptr latest_;
  std::uint64_t version_{0};
};

} // namespace flk
