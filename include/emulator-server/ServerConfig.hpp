#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <spdlog/common.h>
#include <string>

namespace emuserver {

struct ServerConfig {
  // Device-bridge executable; a bare name is looked up on PATH
  std::string bridge_path{"adb"};
  // Overrides auto-selection when set
  std::optional<std::string> default_device;
  // Applied when an operation omits timeout_s
  std::chrono::seconds process_timeout{30};
  uint64_t max_artifact_bytes{16 * 1024 * 1024};
  size_t max_concurrent_processes{4};
  // Where artifacts are staged; empty means the system temp directory
  std::string temp_dir;
  // 0 = serve over stdio
  uint16_t port{0};
  std::string log_file{"emulator_server.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};

  /// Load from YAML. Unknown keys are ignored; throws std::runtime_error on
  /// unreadable files or ill-typed values.
  static ServerConfig load_file(const std::string &yaml_path);

  /// Apply EMULATOR_SERVER_* (and ANDROID_SERIAL) environment overrides
  void apply_environment();

  /// temp_dir, or the system temp directory if unset
  std::string effective_temp_dir() const;
};

/// Locate the bridge executable: PATH first, then the usual SDK locations.
/// Returns `configured` unchanged when nothing better is found.
std::string resolve_bridge_path(const std::string &configured);

spdlog::level::level_enum parse_log_level(const std::string &level);

} // namespace emuserver
