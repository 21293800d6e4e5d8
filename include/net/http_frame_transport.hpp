#pragma once

#include "core/config.hpp"
#include "core/frame_transport.hpp"

namespace flk {

// HTTP binding of FrameTransport: GET <ping_path> for probe, POST <upload_path> for send.
// A fresh client is built for every call so an abandoned request leaves nothing behind.
class HttpFrameTransport final : public FrameTransport {
public:
  explicit HttpFrameTransport(TransportConfig cfg);

  bool probe() override;
  TransportResult send(const EncodedFrame& frame) override;

  const TransportConfig& config() const { return cfg_; }

private:
  TransportConfig cfg_;
};

} // namespace flk
