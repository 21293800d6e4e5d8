#pragma once

#include <string>

#include "core/frame.hpp"

namespace flk {

struct TransportResult {
  bool success{false};
  int status{0};        // HTTP status, 0 when no response came back
  std::string detail;

  // True when the request never got a response (refused, timed out, reset)
  bool network_error() const { return !success && status == 0; }
};

// One-way push of encoded frames to a receiver endpoint
class FrameTransport {
public:
  virtual ~FrameTransport() = default;

  // Cheap liveness check against the receiver, any failure folds to false
  virtual bool probe() = 0;

  // Push one frame. Never throws, failures are reported in the result
  virtual TransportResult send(const EncodedFrame& frame) = 0;
};

} // namespace flk
