#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/frame.hpp"

/*
    FrameEncoder turns a RawFrame from the capture source into the JPEG payload that is pushed to the receiver.

    - JPEG input is passed through untouched
    - YUV 4:2:0 input is repacked into NV21 (Y plane, then interleaved V/U pairs) and compressed with OpenCV

    Expected failures never throw, they come back as an EncodeStatus so the session can skip the frame.
    The encoder copies everything it needs out of the RawFrame before returning.
*/

namespace flk {

enum class EncodeStatus {
  Ok,
  TooLarge,  // Policy skip, payload is over max_frame_bytes
  Failed
};

const char* EncodeStatusName(EncodeStatus s);

struct EncodeResult {
  EncodeStatus status{EncodeStatus::Failed};
  EncodedFrame frame;
  std::string error;

  bool ok() const { return status == EncodeStatus::Ok; }
};

class FrameEncoder {
public:
  explicit FrameEncoder(EncoderConfig cfg);
  virtual ~FrameEncoder() = default;

  FrameEncoder(const FrameEncoder&) = delete;
  FrameEncoder& operator=(const FrameEncoder&) = delete;

  virtual EncodeResult encode(const RawFrame& frame);

  const EncoderConfig& config() const { return cfg_; }

  // Repack the planes of a YUV 4:2:0 frame into an NV21 buffer of width*height*3/2 bytes.
  // Returns false if the planes are too small for the declared geometry
  static bool PackNv21(const RawFrame& frame, std::vector<std::uint8_t>& out, std::string& error);

private:
  EncodeResult finish(std::vector<std::uint8_t> bytes, const RawFrame& frame) const;

  EncoderConfig cfg_;
};

} // namespace flk
