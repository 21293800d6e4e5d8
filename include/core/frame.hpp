#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

/*
    Defines the frame types that travel through the sender side of the link.

    RawFrame is what the capture source hands over: up to three planes that point into a buffer the
    source owns. The source attaches a release callback; the pipeline runs it exactly once when it is done
    reading (or when it drops the frame), after which the source may reuse the buffer.

    EncodedFrame is the compressed payload that goes over the wire, it owns its bytes.
*/

namespace flk {

// Milliseconds since the Unix epoch, the unit used on the wire for capture timestamps
inline std::int64_t NowEpochMs() {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

enum class PixelFormat {
  Yuv420,   // One luma plane + two chroma planes, strides given per plane
  Jpeg,     // Already compressed, plane 0 holds the bytes
  Unknown
};

const char* PixelFormatName(PixelFormat f);

// View into one plane of the capture buffer
struct Plane {
  const std::uint8_t* data{nullptr};
  std::size_t size{0};
  int row_stride{0};    // Bytes between the starts of two rows
  int pixel_stride{1};  // Bytes between two samples of the same row
};

struct RawFrame {
  using ReleaseFn = std::function<void()>;

  RawFrame() = default;
  ~RawFrame() { release(); }

  RawFrame(RawFrame&& other) noexcept { *this = std::move(other); }
  RawFrame& operator=(RawFrame&& other) noexcept {
    if (this != &other) {
      release();
      format = other.format;
      width = other.width;
      height = other.height;
      planes = other.planes;
      plane_count = other.plane_count;
      capture_time_ms = other.capture_time_ms;
      release_ = std::move(other.release_);
      other.release_ = nullptr;
    }
    return *this;
  }

  RawFrame(const RawFrame&) = delete;
  RawFrame& operator=(const RawFrame&) = delete;

  // Hand the buffer back to the capture source. Safe to call more than once
  void release() {
    if (release_) {
      ReleaseFn fn = std::move(release_);
      release_ = nullptr;
      fn();
    }
  }

  void set_release(ReleaseFn fn) { release_ = std::move(fn); }

  PixelFormat format{PixelFormat::Unknown};
  int width{0};
  int height{0};
  std::array<Plane, 3> planes{};
  int plane_count{0};
  std::int64_t capture_time_ms{0};

private:
  ReleaseFn release_;
};

struct EncodedFrame {
  std::vector<std::uint8_t> bytes;
  std::int64_t capture_time_ms{0};
  std::uint64_t sequence_id{0};  // Assigned by StreamSession

  std::size_t size() const { return bytes.size(); }
};

} // namespace flk
