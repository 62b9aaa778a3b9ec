#include "emulator-server/ServerConfig.hpp"
#include "emulator-server/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace emuserver {

namespace fs = std::filesystem;

namespace {

const char *env_or_null(const char *name) {
  const char *value = std::getenv(name);
  if (value && value[0])
    return value;
  return nullptr;
}

bool is_executable(const fs::path &p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && !ec &&
         access(p.c_str(), X_OK) == 0;
}

template <typename T>
T read_scalar(const YAML::Node &doc, const char *key, const T &fallback) {
  if (!doc[key])
    return fallback;
  try {
    return doc[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' has an invalid value: " + e.what());
  }
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

ServerConfig ServerConfig::load_file(const std::string &yaml_path) {
  ServerConfig config;

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(yaml_path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("failed to load config " + yaml_path + ": " +
                             e.what());
  }

  if (doc.IsNull())
    return config;
  if (!doc.IsMap())
    throw std::runtime_error("config root must be a map: " + yaml_path);

  config.bridge_path = read_scalar(doc, "bridge_path", config.bridge_path);
  if (doc["default_device"] && !doc["default_device"].IsNull()) {
    config.default_device = read_scalar<std::string>(doc, "default_device", "");
    if (config.default_device->empty())
      config.default_device.reset();
  }

  auto timeout_s = read_scalar<int64_t>(doc, "process_timeout_s",
                                        config.process_timeout.count());
  if (timeout_s <= 0)
    throw std::runtime_error("process_timeout_s must be positive");
  config.process_timeout = std::chrono::seconds(timeout_s);

  config.max_artifact_bytes =
      read_scalar<uint64_t>(doc, "max_artifact_bytes", config.max_artifact_bytes);

  auto max_procs = read_scalar<int64_t>(
      doc, "max_concurrent_processes",
      static_cast<int64_t>(config.max_concurrent_processes));
  if (max_procs <= 0)
    throw std::runtime_error("max_concurrent_processes must be positive");
  config.max_concurrent_processes = static_cast<size_t>(max_procs);

  config.temp_dir = read_scalar(doc, "temp_dir", config.temp_dir);

  auto port = read_scalar<int64_t>(doc, "port", config.port);
  if (port < 0 || port > 65535)
    throw std::runtime_error("port must be within 0..65535");
  config.port = static_cast<uint16_t>(port);

  config.log_file = read_scalar(doc, "log_file", config.log_file);
  if (doc["log_level"]) {
    config.log_level =
        parse_log_level(read_scalar<std::string>(doc, "log_level", "info"));
  }

  return config;
}

void ServerConfig::apply_environment() {
  if (const char *bridge = env_or_null("EMULATOR_SERVER_BRIDGE")) {
    bridge_path = bridge;
  }

  if (const char *device = env_or_null("EMULATOR_SERVER_DEVICE")) {
    default_device = device;
  } else if (!default_device) {
    if (const char *serial = env_or_null("ANDROID_SERIAL")) {
      default_device = serial;
    }
  }

  if (const char *port_env = env_or_null("EMULATOR_SERVER_PORT")) {
    try {
      int value = std::stoi(port_env);
      if (value >= 0 && value <= 65535) {
        port = static_cast<uint16_t>(value);
      } else {
        LOG_WARN("CONFIG", "ENV", "Ignoring out-of-range port: {}", port_env);
      }
    } catch (const std::exception &) {
      LOG_WARN("CONFIG", "ENV", "Ignoring invalid port: {}", port_env);
    }
  }
}

std::string ServerConfig::effective_temp_dir() const {
  if (!temp_dir.empty())
    return temp_dir;
  return fs::temp_directory_path().string();
}

std::string resolve_bridge_path(const std::string &configured) {
  // Explicit paths are used as given
  if (configured.find('/') != std::string::npos)
    return configured;

  if (const char *path_env = env_or_null("PATH")) {
    std::istringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
      if (dir.empty())
        continue;
      if (is_executable(fs::path(dir) / configured))
        return configured;
    }
  }

  std::vector<fs::path> candidates;
  for (const char *var : {"ANDROID_HOME", "ANDROID_SDK_ROOT"}) {
    if (const char *sdk = env_or_null(var)) {
      candidates.push_back(fs::path(sdk) / "platform-tools" / configured);
    }
  }
  if (const char *home = env_or_null("HOME")) {
    candidates.push_back(fs::path(home) / "Android/Sdk/platform-tools" /
                         configured);
    candidates.push_back(fs::path(home) / "Library/Android/sdk/platform-tools" /
                         configured);
  }
  candidates.push_back(fs::path("/usr/local/bin") / configured);

  for (const auto &candidate : candidates) {
    if (is_executable(candidate)) {
      LOG_INFO("CONFIG", "BRIDGE", "Found bridge at: {}", candidate.string());
      return candidate.string();
    }
  }

  LOG_WARN("CONFIG", "BRIDGE", "{} not found in standard locations",
           configured);
  return configured;
}

} // namespace emuserver
