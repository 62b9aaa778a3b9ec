#pragma once
#include "emulator-server/ipc/ProcessExecutor.hpp"
#include "emulator-server/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace emuserver {
namespace device {

struct DeviceSessionOptions {
  std::string bridge_path{"adb"};
  std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};
  std::string temp_dir; // staging directory for pulled/pushed artifacts
  uint64_t max_artifact_bytes{16 * 1024 * 1024};
};

/// Typed helpers over the device-bridge tool.
///
/// Holds no device state: callers resolve a DeviceTarget per operation and
/// pass it back in. Thread-safe as long as the executor is.
class DeviceSession {
public:
  DeviceSession(ipc::ProcessExecutor &executor, DeviceSessionOptions options);

  /// `adb devices -l`, in bridge order (possibly empty)
  std::vector<DeviceTarget> list_devices(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  /// Resolve the device to use. With an explicit serial it must be attached;
  /// without one exactly one device must be attached.
  /// Throws NoDeviceError, AmbiguousDeviceError or DeviceOfflineError.
  DeviceTarget select_device(
      const std::optional<std::string> &serial,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  /// Run a command line in the device shell and return its stdout
  std::string shell(const DeviceTarget &target, const std::string &command_line,
                    std::optional<std::chrono::milliseconds> timeout =
                        std::nullopt) const;

  /// Like shell() but a non-zero remote exit status is returned, not thrown
  ProcessResult shell_result(const DeviceTarget &target,
                             const std::string &command_line,
                             std::optional<std::chrono::milliseconds> timeout =
                                 std::nullopt) const;

  /// Copy a device file into memory (size-checked before reading)
  Artifact pull(const DeviceTarget &target, const std::string &remote_path,
                std::optional<std::chrono::milliseconds> timeout =
                    std::nullopt) const;

  /// Copy a device file to a local path
  void pull_to(const DeviceTarget &target, const std::string &remote_path,
               const std::string &local_path,
               std::optional<std::chrono::milliseconds> timeout =
                   std::nullopt) const;

  void push(const DeviceTarget &target, const Artifact &artifact,
            const std::string &remote_path,
            std::optional<std::chrono::milliseconds> timeout =
                std::nullopt) const;

  void push_file(const DeviceTarget &target, const std::string &local_path,
                 const std::string &remote_path,
                 std::optional<std::chrono::milliseconds> timeout =
                     std::nullopt) const;

  /// `adb install -r`; returns the bridge output
  std::string install_package(const DeviceTarget &target,
                              const std::string &package_path,
                              std::optional<std::chrono::milliseconds> timeout =
                                  std::nullopt) const;

  /// Best-effort `rm -f` of a device-side staging file
  void remove_remote(const DeviceTarget &target,
                     const std::string &remote_path) const;

  const DeviceSessionOptions &options() const { return options_; }

  /// Parse `adb devices [-l]` output
  static std::vector<DeviceTarget> parse_device_list(const std::string &text);

private:
  /// Run `adb -s <serial> args...`, retrying once on a device-offline signal
  ProcessResult run_for_device(const DeviceTarget &target,
                               const std::vector<std::string> &args,
                               std::optional<std::chrono::milliseconds> timeout,
                               bool check_exit = true) const;

  ProcessResult run_bridge(const std::vector<std::string> &args,
                           std::optional<std::chrono::milliseconds> timeout,
                           bool check_exit = true) const;

  ipc::ProcessExecutor &executor_;
  DeviceSessionOptions options_;
};

/// Quote a value for the device's /system/bin/sh
std::string shell_quote(const std::string &value);

} // namespace device
} // namespace emuserver
