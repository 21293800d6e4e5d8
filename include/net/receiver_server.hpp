#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/frame_receiver.hpp"
#include "stages/stage.hpp"

namespace httplib {
class Server;
}

namespace flk {

/*
    HTTP front of FrameReceiver, served by cpp-httplib on the stage thread:

      GET  <ping_path>     liveness, always 200
      POST <upload_path>   JPEG body + Frame-Timestamp header, always 200 with a JSON ack
      GET  /status         receiver diagnostics as JSON
      GET  /shutdown       asks the owning app to shut down

    httplib runs handlers on its own worker pool, so ingest calls can overlap.
*/
class ReceiverServer final : public Stage {
public:
  using ShutdownFn = std::function<void()>;

  ReceiverServer(ReceiverConfig cfg, std::shared_ptr<FrameReceiver> receiver);
  ~ReceiverServer() override;

  // Bind the listening socket. Port 0 picks a free port. Throws if the port cannot be bound
  int bind();

  int port() const { return bound_port_; }

  // Invoked from the /shutdown handler
  void set_shutdown_handler(ShutdownFn fn) { on_shutdown_ = std::move(fn); }

  static std::string StatusJson(const ReceiverStats& stats, std::int64_t now_ms);

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;
  void interrupt() override;

private:
  // Socket lifecycle: bound by bind(), then either served by run() or closed unserved
  enum class Listen { Unbound, Bound, Serving, Closed };

  void register_routes();
  bool close_unserved();

  ReceiverConfig cfg_;
  std::shared_ptr<FrameReceiver> receiver_;
  std::unique_ptr<httplib::Server> svr_;
  ShutdownFn on_shutdown_;
  int bound_port_{-1};
  std::atomic<Listen> listen_{Listen::Unbound};
};

} // namespace flk
