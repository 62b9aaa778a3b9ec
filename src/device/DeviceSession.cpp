#include "emulator-server/device/DeviceSession.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"
#include "emulator-server/device/ScopedTempFile.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace emuserver {
namespace device {

namespace {

constexpr std::chrono::seconds INSTALL_TIMEOUT{120};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// The bridge reports a device that dropped off (emulator restarting, adbd
// restarting) with one of these messages on stderr.
bool is_offline_signal(const ProcessResult &result, const std::string &serial) {
  for (const auto *text : {&result.stderr_text, &result.stdout_text}) {
    if (contains(*text, "device offline") ||
        contains(*text, "device '" + serial + "' not found") ||
        contains(*text, "device still connecting")) {
      return true;
    }
  }
  return false;
}

std::string mime_type_for(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == ".png")
    return "image/png";
  if (ext == ".jpg" || ext == ".jpeg")
    return "image/jpeg";
  if (ext == ".xml")
    return "application/xml";
  if (ext == ".txt" || ext == ".log")
    return "text/plain";
  if (ext == ".json")
    return "application/json";
  if (ext == ".apk")
    return "application/vnd.android.package-archive";
  return "application/octet-stream";
}

std::string join_serials(const std::vector<DeviceTarget> &devices) {
  std::string out;
  for (const auto &d : devices) {
    if (!out.empty())
      out += ", ";
    out += d.serial;
  }
  return out;
}

const DeviceTarget *find_serial(const std::vector<DeviceTarget> &devices,
                                const std::string &serial) {
  for (const auto &d : devices) {
    if (d.serial == serial)
      return &d;
  }
  return nullptr;
}

} // namespace

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

DeviceSession::DeviceSession(ipc::ProcessExecutor &executor,
                             DeviceSessionOptions options)
    : executor_(executor), options_(std::move(options)) {
  if (options_.temp_dir.empty()) {
    options_.temp_dir = std::filesystem::temp_directory_path().string();
  }
}

std::vector<DeviceTarget>
DeviceSession::parse_device_list(const std::string &text) {
  std::vector<DeviceTarget> devices;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty() || line[0] == '*')
      continue;
    if (line.rfind("List of devices", 0) == 0)
      continue;

    std::istringstream ls(line);
    std::vector<std::string> tokens;
    std::string token;
    while (ls >> token) {
      tokens.push_back(token);
    }
    if (tokens.size() < 2)
      continue;

    DeviceTarget target;
    target.serial = tokens[0];
    size_t next = 2;
    if (tokens[1] == "no" && tokens.size() > 2 && tokens[2] == "permissions") {
      target.state = "no permissions";
      next = 3;
    } else {
      target.state = tokens[1];
    }

    for (size_t i = next; i < tokens.size(); ++i) {
      auto colon = tokens[i].find(':');
      if (colon == std::string::npos || colon == 0)
        continue;
      target.details[tokens[i].substr(0, colon)] = tokens[i].substr(colon + 1);
    }
    devices.push_back(std::move(target));
  }
  return devices;
}

ProcessResult
DeviceSession::run_bridge(const std::vector<std::string> &args,
                          std::optional<std::chrono::milliseconds> timeout,
                          bool check_exit) const {
  ipc::ProcessRequest request;
  request.program = options_.bridge_path;
  request.args = args;
  request.timeout = timeout.value_or(options_.default_timeout);
  request.check_exit = check_exit;
  return executor_.execute(request);
}

ProcessResult
DeviceSession::run_for_device(const DeviceTarget &target,
                              const std::vector<std::string> &args,
                              std::optional<std::chrono::milliseconds> timeout,
                              bool check_exit) const {
  std::vector<std::string> full_args{"-s", target.serial};
  full_args.insert(full_args.end(), args.begin(), args.end());

  // Without check_exit the offline signal comes back as a plain result
  auto went_offline = [&target](const ProcessResult &result) {
    return result.exit_code != 0 && is_offline_signal(result, target.serial);
  };

  try {
    auto result = run_bridge(full_args, timeout, check_exit);
    if (!went_offline(result))
      return result;
    LOG_WARN("DEVICE", target.serial, "Device offline, retrying once: {}",
             result.stderr_text);
  } catch (const ProcessError &e) {
    if (e.reason() != ProcessFailure::NonZeroExit ||
        !is_offline_signal(e.result(), target.serial)) {
      throw;
    }
    LOG_WARN("DEVICE", target.serial, "Device offline, retrying once: {}",
             e.what());
  }

  try {
    auto result = run_bridge(full_args, timeout, check_exit);
    if (went_offline(result)) {
      throw DeviceOfflineError("device " + target.serial +
                               " is offline: " + result.stderr_text);
    }
    return result;
  } catch (const ProcessError &e) {
    if (e.reason() == ProcessFailure::NonZeroExit &&
        is_offline_signal(e.result(), target.serial)) {
      throw DeviceOfflineError("device " + target.serial +
                               " is offline: " + e.what());
    }
    throw;
  }
}

std::vector<DeviceTarget> DeviceSession::list_devices(
    std::optional<std::chrono::milliseconds> timeout) const {
  auto result = run_bridge({"devices", "-l"}, timeout);
  auto devices = parse_device_list(result.stdout_text);
  LOG_DEBUG("DEVICE", "LIST", "{} device(s) attached", devices.size());
  return devices;
}

DeviceTarget DeviceSession::select_device(
    const std::optional<std::string> &serial,
    std::optional<std::chrono::milliseconds> timeout) const {
  auto devices = list_devices(timeout);

  DeviceTarget target;
  if (serial) {
    const auto *found = find_serial(devices, *serial);
    if (!found) {
      throw NoDeviceError("device '" + *serial + "' is not connected");
    }
    target = *found;
  } else {
    if (devices.empty()) {
      throw NoDeviceError("no devices connected; start an emulator or "
                          "attach a device");
    }
    if (devices.size() > 1) {
      throw AmbiguousDeviceError(
          fmt::format("{} devices connected ({}); pass 'device' to choose one",
                      devices.size(), join_serials(devices)));
    }
    target = devices.front();
  }

  if (target.state == "offline") {
    LOG_WARN("DEVICE", target.serial, "Device offline, re-checking once");
    devices = list_devices(timeout);
    const auto *again = find_serial(devices, target.serial);
    if (!again || !again->is_ready()) {
      throw DeviceOfflineError("device " + target.serial + " is offline");
    }
    target = *again;
  }

  if (!target.is_ready()) {
    throw DeviceOfflineError("device " + target.serial + " is " +
                             target.state);
  }

  LOG_DEBUG("DEVICE", target.serial, "Selected device");
  return target;
}

std::string
DeviceSession::shell(const DeviceTarget &target, const std::string &command_line,
                     std::optional<std::chrono::milliseconds> timeout) const {
  return run_for_device(target, {"shell", command_line}, timeout).stdout_text;
}

ProcessResult DeviceSession::shell_result(
    const DeviceTarget &target, const std::string &command_line,
    std::optional<std::chrono::milliseconds> timeout) const {
  return run_for_device(target, {"shell", command_line}, timeout, false);
}

Artifact
DeviceSession::pull(const DeviceTarget &target, const std::string &remote_path,
                    std::optional<std::chrono::milliseconds> timeout) const {
  std::string name = std::filesystem::path(remote_path).filename().string();
  ScopedTempFile staging(options_.temp_dir, "emu-pull-",
                         std::filesystem::path(remote_path).extension().string());

  run_for_device(target, {"pull", remote_path, staging.path()}, timeout);

  Artifact artifact;
  artifact.name = name;
  artifact.mime_type = mime_type_for(remote_path);
  artifact.bytes = staging.read_all(options_.max_artifact_bytes);

  LOG_DEBUG("DEVICE", target.serial, "Pulled {} ({} bytes)", remote_path,
            artifact.size());
  return artifact;
}

void DeviceSession::pull_to(
    const DeviceTarget &target, const std::string &remote_path,
    const std::string &local_path,
    std::optional<std::chrono::milliseconds> timeout) const {
  run_for_device(target, {"pull", remote_path, local_path}, timeout);
}

void DeviceSession::push(const DeviceTarget &target, const Artifact &artifact,
                         const std::string &remote_path,
                         std::optional<std::chrono::milliseconds> timeout) const {
  ScopedTempFile staging(options_.temp_dir, "emu-push-");
  staging.write(artifact.bytes);

  run_for_device(target, {"push", staging.path(), remote_path}, timeout);

  LOG_DEBUG("DEVICE", target.serial, "Pushed {} bytes to {}", artifact.size(),
            remote_path);
}

void DeviceSession::push_file(
    const DeviceTarget &target, const std::string &local_path,
    const std::string &remote_path,
    std::optional<std::chrono::milliseconds> timeout) const {
  run_for_device(target, {"push", local_path, remote_path}, timeout);
}

std::string DeviceSession::install_package(
    const DeviceTarget &target, const std::string &package_path,
    std::optional<std::chrono::milliseconds> timeout) const {
  auto result = run_for_device(
      target, {"install", "-r", package_path},
      timeout.value_or(std::chrono::milliseconds(INSTALL_TIMEOUT)));

  // Older bridge versions exit 0 and report the failure on stdout
  auto failure = result.stdout_text.find("Failure");
  if (failure != std::string::npos) {
    auto end = result.stdout_text.find('\n', failure);
    throw ProcessError(ProcessFailure::NonZeroExit,
                       "install failed: " +
                           result.stdout_text.substr(failure, end - failure),
                       result);
  }
  return result.stdout_text;
}

void DeviceSession::remove_remote(const DeviceTarget &target,
                                  const std::string &remote_path) const {
  try {
    run_for_device(target, {"shell", "rm -f " + shell_quote(remote_path)},
                   std::nullopt);
  } catch (const ServerError &e) {
    LOG_WARN("DEVICE", target.serial, "Failed to remove {}: {}", remote_path,
             e.what());
  }
}

} // namespace device
} // namespace emuserver
