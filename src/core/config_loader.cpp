#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace flk {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadCamera(const YAML::Node& root, CameraConfig& cfg) {
  const YAML::Node cam = root["camera"];
  if (!cam) return;
  const std::string p = "camera";

  cfg.backend = GetOrKey<std::string>(cam, "backend", PathJoin(p, "backend"), cfg.backend);
  cfg.device_index = GetOrKey<int>(cam, "device_index", PathJoin(p, "device_index"), cfg.device_index);
  cfg.width = GetOrKey<int>(cam, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(cam, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(cam, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.flip_vertical = GetOrKey<bool>(cam, "flip_vertical", PathJoin(p, "flip_vertical"), cfg.flip_vertical);
  cfg.flip_horizontal = GetOrKey<bool>(cam, "flip_horizontal", PathJoin(p, "flip_horizontal"), cfg.flip_horizontal);
}

static void LoadEncoder(const YAML::Node& root, EncoderConfig& cfg) {
  const YAML::Node enc = root["encoder"];
  if (!enc) return;
  const std::string p = "encoder";

  cfg.jpeg_quality = GetOrKey<int>(enc, "jpeg_quality", PathJoin(p, "jpeg_quality"), cfg.jpeg_quality);
  cfg.max_frame_bytes = GetOrKey<std::size_t>(enc, "max_frame_bytes", PathJoin(p, "max_frame_bytes"), cfg.max_frame_bytes);
}

static void LoadTransport(const YAML::Node& root, TransportConfig& cfg) {
  const YAML::Node tr = root["transport"];
  if (!tr) return;
  const std::string p = "transport";

  cfg.host = GetOrKey<std::string>(tr, "host", PathJoin(p, "host"), cfg.host);
  cfg.port = GetOrKey<int>(tr, "port", PathJoin(p, "port"), cfg.port);
  cfg.ping_path = GetOrKey<std::string>(tr, "ping_path", PathJoin(p, "ping_path"), cfg.ping_path);
  cfg.upload_path = GetOrKey<std::string>(tr, "upload_path", PathJoin(p, "upload_path"), cfg.upload_path);

  cfg.connect_timeout_ms = GetOrKey<int>(tr, "connect_timeout_ms", PathJoin(p, "connect_timeout_ms"), cfg.connect_timeout_ms);
  cfg.read_timeout_ms = GetOrKey<int>(tr, "read_timeout_ms", PathJoin(p, "read_timeout_ms"), cfg.read_timeout_ms);
  cfg.write_timeout_ms = GetOrKey<int>(tr, "write_timeout_ms", PathJoin(p, "write_timeout_ms"), cfg.write_timeout_ms);
  cfg.probe_read_timeout_ms = GetOrKey<int>(tr, "probe_read_timeout_ms", PathJoin(p, "probe_read_timeout_ms"), cfg.probe_read_timeout_ms);
}

static void LoadSession(const YAML::Node& root, SessionConfig& cfg) {
  const YAML::Node s = root["session"];
  if (!s) return;
  const std::string p = "session";

  cfg.max_consecutive_failures = GetOrKey<int>(s, "max_consecutive_failures", PathJoin(p, "max_consecutive_failures"), cfg.max_consecutive_failures);
}

static void LoadReceiver(const YAML::Node& root, ReceiverConfig& cfg) {
  const YAML::Node rx = root["receiver"];
  if (!rx) return;
  const std::string p = "receiver";

  cfg.bind_address = GetOrKey<std::string>(rx, "bind_address", PathJoin(p, "bind_address"), cfg.bind_address);
  cfg.port = GetOrKey<int>(rx, "port", PathJoin(p, "port"), cfg.port);
  cfg.ping_path = GetOrKey<std::string>(rx, "ping_path", PathJoin(p, "ping_path"), cfg.ping_path);
  cfg.upload_path = GetOrKey<std::string>(rx, "upload_path", PathJoin(p, "upload_path"), cfg.upload_path);
  cfg.idle_timeout_ms = GetOrKey<int>(rx, "idle_timeout_ms", PathJoin(p, "idle_timeout_ms"), cfg.idle_timeout_ms);
}

static void LoadDisplay(const YAML::Node& root, DisplayConfig& cfg) {
  const YAML::Node d = root["display"];
  if (!d) return;
  const std::string p = "display";

  cfg.enabled = GetOrKey<bool>(d, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.window_name = GetOrKey<std::string>(d, "window_name", PathJoin(p, "window_name"), cfg.window_name);
  cfg.poll_interval_ms = GetOrKey<int>(d, "poll_interval_ms", PathJoin(p, "poll_interval_ms"), cfg.poll_interval_ms);
  cfg.show_hud = GetOrKey<bool>(d, "show_hud", PathJoin(p, "show_hud"), cfg.show_hud);
  cfg.screenshot_dir = GetOrKey<std::string>(d, "screenshot_dir", PathJoin(p, "screenshot_dir"), cfg.screenshot_dir);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
}

static void CheckPort(int port, const std::string& key_path) {
  if (port <= 0 || port > 65535) throw ConfigError(key_path, "must be in [1, 65535]");
}

static void CheckPath(const std::string& path, const std::string& key_path) {
  if (path.empty() || path.front() != '/') throw ConfigError(key_path, "must start with '/'");
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.camera.backend != "opencv" && cfg.camera.backend != "synthetic")
    throw ConfigError("camera.backend", "unknown backend '" + cfg.camera.backend + "'. Use: opencv | synthetic");
  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) throw ConfigError("camera", "width/height must be > 0");
  if (cfg.camera.width % 2 != 0 || cfg.camera.height % 2 != 0) throw ConfigError("camera", "width/height must be even");
  if (cfg.camera.fps <= 0) throw ConfigError("camera.fps", "must be > 0");

  if (cfg.encoder.jpeg_quality < 0 || cfg.encoder.jpeg_quality > 100)
    throw ConfigError("encoder.jpeg_quality", "must be in [0, 100]");
  if (cfg.encoder.max_frame_bytes < 1) throw ConfigError("encoder.max_frame_bytes", "must be >= 1");

  if (cfg.transport.host.empty()) throw ConfigError("transport.host", "must not be empty");
  CheckPort(cfg.transport.port, "transport.port");
  CheckPath(cfg.transport.ping_path, "transport.ping_path");
  CheckPath(cfg.transport.upload_path, "transport.upload_path");
  if (cfg.transport.connect_timeout_ms <= 0) throw ConfigError("transport.connect_timeout_ms", "must be > 0");
  if (cfg.transport.read_timeout_ms <= 0) throw ConfigError("transport.read_timeout_ms", "must be > 0");
  if (cfg.transport.write_timeout_ms <= 0) throw ConfigError("transport.write_timeout_ms", "must be > 0");
  if (cfg.transport.probe_read_timeout_ms <= 0) throw ConfigError("transport.probe_read_timeout_ms", "must be > 0");

  if (cfg.session.max_consecutive_failures < 1)
    throw ConfigError("session.max_consecutive_failures", "must be >= 1");

  if (cfg.receiver.bind_address.empty()) throw ConfigError("receiver.bind_address", "must not be empty");
  CheckPort(cfg.receiver.port, "receiver.port");
  CheckPath(cfg.receiver.ping_path, "receiver.ping_path");
  CheckPath(cfg.receiver.upload_path, "receiver.upload_path");
  if (cfg.receiver.ping_path == cfg.receiver.upload_path)
    throw ConfigError("receiver.upload_path", "must differ from receiver.ping_path");
  if (cfg.receiver.idle_timeout_ms <= 0) throw ConfigError("receiver.idle_timeout_ms", "must be > 0");

  if (cfg.display.poll_interval_ms <= 0) throw ConfigError("display.poll_interval_ms", "must be > 0");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  if (root && !root.IsNull() && !root.IsMap()) throw ConfigError("<root>", "must be a mapping");

  LoadCamera(root, cfg.camera);
  LoadEncoder(root, cfg.encoder);
  LoadTransport(root, cfg.transport);
  LoadSession(root, cfg.session);
  LoadReceiver(root, cfg.receiver);
  LoadDisplay(root, cfg.display);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace flk
