#include "emulator-server/server/CommandHandlers.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"
#include "emulator-server/device/UiHierarchy.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <regex>
#include <sstream>
#include <unistd.h>

using json = nlohmann::json;

namespace emuserver {
namespace server {

namespace {

constexpr const char *REMOTE_TEMP_DIR = "/data/local/tmp";
constexpr const char *CERT_DIR = "/sdcard/Download";
constexpr std::chrono::seconds INSTALL_TIMEOUT{120};
constexpr std::chrono::seconds SHELL_TIMEOUT{60};

const std::map<std::string, int> KEY_CODES = {
    {"back", 4},         {"home", 3},         {"recent", 187},
    {"menu", 82},        {"power", 26},       {"volume_up", 24},
    {"volume_down", 25}, {"enter", 66},       {"delete", 67}};

// ---------------------------------------------------------------------------
// ParamSpec builders
// ---------------------------------------------------------------------------

ParamSpec string_param(const std::string &name, bool required,
                       const std::string &description) {
  ParamSpec p;
  p.name = name;
  p.type = ParamType::String;
  p.required = required;
  p.description = description;
  return p;
}

ParamSpec int_param(const std::string &name, bool required,
                    const std::string &description,
                    std::optional<double> min = std::nullopt,
                    std::optional<double> max = std::nullopt) {
  ParamSpec p;
  p.name = name;
  p.type = ParamType::Integer;
  p.required = required;
  p.description = description;
  p.min = min;
  p.max = max;
  return p;
}

ParamSpec enum_param(const std::string &name, bool required,
                     std::vector<std::string> allowed,
                     const std::string &description) {
  ParamSpec p;
  p.name = name;
  p.type = ParamType::Enum;
  p.required = required;
  p.allowed = std::move(allowed);
  p.description = description;
  return p;
}

ParamSpec with_default(ParamSpec p, json value) {
  p.default_value = std::move(value);
  return p;
}

ParamSpec local_file(ParamSpec p) {
  p.existing_file = true;
  return p;
}

ParamSpec single_line(ParamSpec p) {
  p.single_line = true;
  return p;
}

ParamSpec matching(ParamSpec p, const std::string &pattern) {
  p.pattern = pattern;
  return p;
}

const std::string PACKAGE_PATTERN = R"([A-Za-z0-9_]+(\.[A-Za-z0-9_]+)*)";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Unique device-side scratch path
std::string remote_temp_path(const std::string &stem, const std::string &ext) {
  static std::atomic<uint64_t> counter{0};
  static const uint32_t salt = std::random_device{}();
  return fmt::format("{}/emu-{}-{}-{:x}-{}{}", REMOTE_TEMP_DIR, stem,
                     ::getpid(), salt, counter.fetch_add(1), ext);
}

/// Removes a device-side scratch file when the handler exits
class RemoteTempFile {
public:
  RemoteTempFile(const device::DeviceSession &session,
                 const DeviceTarget &target, std::string path)
      : session_(session), target_(target), path_(std::move(path)) {}

  ~RemoteTempFile() {
    try {
      session_.remove_remote(target_, path_);
    } catch (const std::exception &e) {
      LOG_WARN("HANDLER", target_.serial, "Cleanup of {} failed: {}", path_,
               e.what());
    }
  }

  RemoteTempFile(const RemoteTempFile &) = delete;
  RemoteTempFile &operator=(const RemoteTempFile &) = delete;

  const std::string &path() const { return path_; }

private:
  const device::DeviceSession &session_;
  const DeviceTarget &target_;
  std::string path_;
};

std::optional<std::string> optional_string(const json &args,
                                           const std::string &name) {
  auto it = args.find(name);
  if (it == args.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

json device_to_json(const DeviceTarget &d) {
  json j;
  j["serial"] = d.serial;
  j["state"] = d.state;
  j["details"] = d.details;
  return j;
}

device::ElementCriteria criteria_from(const json &args) {
  device::ElementCriteria c;
  c.text = optional_string(args, "text");
  c.resource_id = optional_string(args, "resource_id");
  c.class_name = optional_string(args, "class_name");
  c.content_desc = optional_string(args, "content_desc");
  return c;
}

/// Dump the window hierarchy on the device and pull it back as XML text
std::string dump_hierarchy(OperationContext &ctx) {
  const auto &target = ctx.device();
  RemoteTempFile remote(ctx.session, target,
                        remote_temp_path("window", ".xml"));

  auto out = ctx.session.shell(target, "uiautomator dump " + remote.path(),
                               ctx.timeout);
  // uiautomator reports some failures on stdout with exit status 0
  if (out.find("ERROR") != std::string::npos) {
    ProcessResult r;
    r.stdout_text = out;
    r.exit_code = 0;
    throw ProcessError(ProcessFailure::NonZeroExit,
                       "uiautomator dump failed: " + out, r);
  }

  auto artifact = ctx.session.pull(target, remote.path(), ctx.timeout);
  return artifact.as_text();
}

std::vector<device::UiNode> load_hierarchy(OperationContext &ctx) {
  auto xml = dump_hierarchy(ctx);
  try {
    return device::parse_ui_hierarchy(xml);
  } catch (const std::invalid_argument &e) {
    throw InternalError(std::string("cannot parse UI hierarchy: ") + e.what());
  }
}

/// Some device commands exit 0 and print the failure
void check_output(const std::string &what, const std::string &output,
                  const std::vector<std::string> &failure_markers) {
  for (const auto &marker : failure_markers) {
    auto pos = output.find(marker);
    if (pos == std::string::npos)
      continue;
    auto end = output.find('\n', pos);
    ProcessResult r;
    r.stdout_text = output;
    r.exit_code = 0;
    throw ProcessError(ProcessFailure::NonZeroExit,
                       what + ": " + output.substr(pos, end - pos), r);
  }
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

Artifact read_local_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw ValidationError(ValidationReason::InvalidValue, "cert_path",
                          "cannot read " + path);
  }
  Artifact a;
  a.name = std::filesystem::path(path).filename().string();
  a.bytes.assign(std::istreambuf_iterator<char>(ifs),
                 std::istreambuf_iterator<char>());
  return a;
}

} // namespace

// ---------------------------------------------------------------------------
// Public helpers
// ---------------------------------------------------------------------------

std::string escape_input_text(const std::string &text) {
  static const std::string special = "\\'\"`$&|;<>()[]{}*?!~#";
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (c == ' ') {
      out += "%s";
    } else if (special.find(c) != std::string::npos) {
      out += '\\';
      out += c;
    } else {
      out += c;
    }
  }
  return out;
}

std::vector<std::string> split_input_text(const std::string &text) {
  std::vector<std::string> chunks;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == 's' && i > 0 && text[i - 1] == '%') {
      chunks.push_back(current);
      current.clear();
    }
    current += text[i];
  }
  if (!current.empty())
    chunks.push_back(current);
  return chunks;
}

std::optional<int> key_code(const std::string &key) {
  auto it = KEY_CODES.find(key);
  if (it == KEY_CODES.end())
    return std::nullopt;
  return it->second;
}

std::map<std::string, std::string> parse_getprop(const std::string &text) {
  static const std::regex prop_re(R"(^\s*\[([^\]]+)\]\s*:\s*\[(.*)\]\s*$)");
  std::map<std::string, std::string> props;
  std::istringstream ss(text);
  std::string line;
  std::smatch m;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (std::regex_match(line, m, prop_re)) {
      props[m[1].str()] = m[2].str();
    }
  }
  return props;
}

// ---------------------------------------------------------------------------
// Capabilities and devices
// ---------------------------------------------------------------------------

OperationResult handle_list_operations(OperationContext &ctx, const json &) {
  return OperationResult::from_json(ctx.registry.describe_json());
}

OperationResult handle_list_devices(OperationContext &ctx, const json &) {
  auto devices = ctx.session.list_devices(ctx.timeout);
  json list = json::array();
  for (const auto &d : devices) {
    list.push_back(device_to_json(d));
  }
  json out;
  out["devices"] = list;
  out["count"] = devices.size();
  if (ctx.connection.selected_device) {
    out["selected"] = *ctx.connection.selected_device;
  }
  return OperationResult::from_json(out);
}

OperationResult handle_select_device(OperationContext &ctx,
                                     const json &args) {
  std::string serial = args.at("serial").get<std::string>();
  auto target = ctx.session.select_device(serial, ctx.timeout);
  ctx.connection.selected_device = target.serial;

  LOG_INFO("HANDLER", ctx.connection.connection_id,
           "Connection now targets device {}", target.serial);

  json out;
  out["selected"] = target.serial;
  out["device"] = device_to_json(target);
  return OperationResult::from_json(out);
}

OperationResult handle_get_device_info(OperationContext &ctx, const json &) {
  const auto &target = ctx.device();
  auto props = parse_getprop(ctx.session.shell(target, "getprop", ctx.timeout));
  auto prop = [&props](const std::string &key) -> json {
    auto it = props.find(key);
    return it == props.end() ? json(nullptr) : json(it->second);
  };

  json out;
  out["serial"] = target.serial;
  out["state"] = target.state;
  out["model"] = prop("ro.product.model");
  out["manufacturer"] = prop("ro.product.manufacturer");
  out["android_version"] = prop("ro.build.version.release");
  out["sdk_version"] = prop("ro.build.version.sdk");
  out["cpu_abi"] = prop("ro.product.cpu.abi");
  out["is_emulator"] = props.count("ro.kernel.qemu") > 0 &&
                       props["ro.kernel.qemu"] == "1";

  auto wm = ctx.session.shell(target, "wm size", ctx.timeout);
  static const std::regex size_re(R"((Physical|Override) size:\s*(\d+)x(\d+))");
  out["screen_size"] = nullptr;
  for (auto it = std::sregex_iterator(wm.begin(), wm.end(), size_re);
       it != std::sregex_iterator(); ++it) {
    // Override wins when present
    out["screen_size"] = {{"width", std::stoi((*it)[2].str())},
                          {"height", std::stoi((*it)[3].str())}};
  }
  return OperationResult::from_json(out);
}

// ---------------------------------------------------------------------------
// Screen and UI
// ---------------------------------------------------------------------------

OperationResult handle_capture_screenshot(OperationContext &ctx,
                                          const json &args) {
  const auto &target = ctx.device();
  RemoteTempFile remote(ctx.session, target,
                        remote_temp_path("screen", ".png"));

  ctx.session.shell(target, "screencap -p " + remote.path(), ctx.timeout);
  auto artifact = ctx.session.pull(target, remote.path(), ctx.timeout);
  artifact.name = "screenshot.png";
  artifact.mime_type = "image/png";

  if (auto save_path = optional_string(args, "save_path")) {
    std::ofstream ofs(*save_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw ValidationError(ValidationReason::InvalidValue, "save_path",
                            "cannot write " + *save_path);
    }
    ofs.write(reinterpret_cast<const char *>(artifact.bytes.data()),
              static_cast<std::streamsize>(artifact.bytes.size()));
    LOG_INFO("HANDLER", target.serial, "Screenshot saved to {}", *save_path);
  }
  return OperationResult::from_artifact(std::move(artifact));
}

OperationResult handle_get_ui_hierarchy(OperationContext &ctx, const json &) {
  return OperationResult::from_text(dump_hierarchy(ctx));
}

OperationResult handle_find_element(OperationContext &ctx, const json &args) {
  auto found = device::find_elements(load_hierarchy(ctx), criteria_from(args));

  json elements = json::array();
  for (const auto &node : found) {
    elements.push_back(node.to_json());
  }
  json out;
  out["matches"] = found.size();
  out["elements"] = elements;
  return OperationResult::from_json(out);
}

OperationResult handle_tap_coordinates(OperationContext &ctx,
                                       const json &args) {
  auto x = args.at("x").get<int64_t>();
  auto y = args.at("y").get<int64_t>();
  ctx.session.shell(ctx.device(), fmt::format("input tap {} {}", x, y),
                    ctx.timeout);
  return OperationResult::from_text(fmt::format("Tapped at ({}, {})", x, y));
}

OperationResult handle_tap_element(OperationContext &ctx, const json &args) {
  auto found = device::find_elements(load_hierarchy(ctx), criteria_from(args));
  auto index = static_cast<size_t>(args.value("index", int64_t{0}));

  json out;
  out["matches"] = found.size();
  if (found.empty()) {
    out["tapped"] = false;
    return OperationResult::from_json(out);
  }
  if (index >= found.size()) {
    out["tapped"] = false;
    out["reason"] = fmt::format("index {} out of range", index);
    return OperationResult::from_json(out);
  }

  const auto &node = found[index];
  out["element"] = node.to_json();
  if (!node.bounds) {
    out["tapped"] = false;
    out["reason"] = "element has no bounds";
    return OperationResult::from_json(out);
  }

  int x = node.bounds->center_x();
  int y = node.bounds->center_y();
  ctx.session.shell(ctx.device(), fmt::format("input tap {} {}", x, y),
                    ctx.timeout);
  out["tapped"] = true;
  out["x"] = x;
  out["y"] = y;
  return OperationResult::from_json(out);
}

OperationResult handle_swipe(OperationContext &ctx, const json &args) {
  auto x1 = args.at("start_x").get<int64_t>();
  auto y1 = args.at("start_y").get<int64_t>();
  auto x2 = args.at("end_x").get<int64_t>();
  auto y2 = args.at("end_y").get<int64_t>();
  auto duration = args.at("duration_ms").get<int64_t>();

  ctx.session.shell(ctx.device(),
                    fmt::format("input swipe {} {} {} {} {}", x1, y1, x2, y2,
                                duration),
                    ctx.timeout);
  return OperationResult::from_text(
      fmt::format("Swiped from ({}, {}) to ({}, {})", x1, y1, x2, y2));
}

OperationResult handle_input_text(OperationContext &ctx, const json &args) {
  auto text = args.at("text").get<std::string>();
  if (text.empty()) {
    throw ValidationError(ValidationReason::InvalidValue, "text",
                          "text must not be empty");
  }
  for (const auto &chunk : split_input_text(text)) {
    ctx.session.shell(ctx.device(), "input text " + escape_input_text(chunk),
                      ctx.timeout);
  }
  return OperationResult::from_text("Entered text: " + text);
}

OperationResult handle_press_key(OperationContext &ctx, const json &args) {
  auto key = args.at("key").get<std::string>();
  auto code = key_code(key);
  if (!code) {
    throw ValidationError(ValidationReason::InvalidValue, "key",
                          "unknown key '" + key + "'");
  }
  ctx.session.shell(ctx.device(), fmt::format("input keyevent {}", *code),
                    ctx.timeout);
  return OperationResult::from_text(fmt::format("Pressed {} key", key));
}

// ---------------------------------------------------------------------------
// Apps
// ---------------------------------------------------------------------------

OperationResult handle_install_app(OperationContext &ctx, const json &args) {
  auto apk = args.at("apk_path").get<std::string>();
  std::chrono::milliseconds timeout =
      args.contains("timeout_s") ? ctx.timeout
                                 : std::chrono::milliseconds(INSTALL_TIMEOUT);

  auto output = ctx.session.install_package(ctx.device(), apk, timeout);
  return OperationResult::from_text("Installed " + apk + "\n" + trim(output));
}

OperationResult handle_launch_app(OperationContext &ctx, const json &args) {
  auto package = args.at("package").get<std::string>();
  auto output = ctx.session.shell(
      ctx.device(),
      "monkey -p " + package + " -c android.intent.category.LAUNCHER 1",
      ctx.timeout);
  check_output("launch failed", output,
               {"No activities found", "monkey aborted"});
  return OperationResult::from_text("Launched " + package);
}

OperationResult handle_stop_app(OperationContext &ctx, const json &args) {
  auto package = args.at("package").get<std::string>();
  ctx.session.shell(ctx.device(), "am force-stop " + package, ctx.timeout);
  return OperationResult::from_text("Stopped " + package);
}

OperationResult handle_clear_app_data(OperationContext &ctx,
                                      const json &args) {
  auto package = args.at("package").get<std::string>();
  auto output =
      ctx.session.shell(ctx.device(), "pm clear " + package, ctx.timeout);
  check_output("clear failed", output, {"Failed", "Error"});
  return OperationResult::from_text("Cleared data for " + package);
}

OperationResult handle_list_packages(OperationContext &ctx, const json &args) {
  std::string command = "pm list packages";
  auto filter = optional_string(args, "filter");
  if (filter && !filter->empty()) {
    command += " " + device::shell_quote(*filter);
  }

  auto output = ctx.session.shell(ctx.device(), command, ctx.timeout);
  std::vector<std::string> packages;
  std::istringstream ss(output);
  std::string line;
  while (std::getline(ss, line)) {
    line = trim(line);
    if (line.rfind("package:", 0) == 0) {
      packages.push_back(line.substr(8));
    }
  }
  std::sort(packages.begin(), packages.end());

  json out;
  out["packages"] = packages;
  out["count"] = packages.size();
  return OperationResult::from_json(out);
}

// ---------------------------------------------------------------------------
// Network interception
// ---------------------------------------------------------------------------

OperationResult handle_setup_proxy(OperationContext &ctx, const json &args) {
  auto host = args.at("host").get<std::string>();
  auto port = args.at("port").get<int64_t>();
  auto proxy = fmt::format("{}:{}", host, port);

  ctx.session.shell(ctx.device(),
                    "settings put global http_proxy " +
                        device::shell_quote(proxy),
                    ctx.timeout);
  return OperationResult::from_text(
      "Proxy set to " + proxy +
      "\nApps may need a restart to pick up the new proxy.");
}

OperationResult handle_clear_proxy(OperationContext &ctx, const json &) {
  ctx.session.shell(ctx.device(), "settings put global http_proxy :0",
                    ctx.timeout);
  return OperationResult::from_text("Proxy cleared");
}

OperationResult handle_install_certificate(OperationContext &ctx,
                                           const json &args) {
  auto cert_path = args.at("cert_path").get<std::string>();
  auto cert_name = args.at("cert_name").get<std::string>();
  auto remote = fmt::format("{}/{}.crt", CERT_DIR, cert_name);

  auto artifact = read_local_file(cert_path);
  ctx.session.push(ctx.device(), artifact, remote, ctx.timeout);

  std::ostringstream text;
  text << "Certificate pushed to " << remote << "\n\n"
       << "To finish installing it on the device:\n"
       << "  1. Open Settings\n"
       << "  2. Security > Encryption & credentials > Install a certificate\n"
       << "  3. Choose 'CA certificate'\n"
       << "  4. Pick " << cert_name << ".crt from Downloads and confirm\n\n"
       << "Android 7+ apps only trust user CAs when their network security\n"
       << "config allows it; system-store installation needs root.\n";
  return OperationResult::from_text(text.str());
}

// ---------------------------------------------------------------------------
// Shell, files and logs
// ---------------------------------------------------------------------------

OperationResult handle_execute_shell(OperationContext &ctx, const json &args) {
  auto command = args.at("command").get<std::string>();
  std::chrono::milliseconds timeout =
      args.contains("timeout_s") ? ctx.timeout
                                 : std::chrono::milliseconds(SHELL_TIMEOUT);
  auto result = ctx.session.shell_result(ctx.device(), command, timeout);

  json out;
  out["command"] = command;
  out["exit_code"] = result.exit_code;
  out["stdout"] = result.stdout_text;
  out["stderr"] = result.stderr_text;
  out["duration_ms"] = result.duration.count();
  return OperationResult::from_json(out);
}

OperationResult handle_pull_file(OperationContext &ctx, const json &args) {
  auto remote = args.at("remote_path").get<std::string>();
  auto local = optional_string(args, "local_path");

  if (!local) {
    return OperationResult::from_artifact(
        ctx.session.pull(ctx.device(), remote, ctx.timeout));
  }

  ctx.session.pull_to(ctx.device(), remote, *local, ctx.timeout);
  std::error_code ec;
  auto size = std::filesystem::file_size(*local, ec);

  json out;
  out["remote_path"] = remote;
  out["local_path"] = *local;
  out["size"] = ec ? json(nullptr) : json(size);
  return OperationResult::from_json(out);
}

OperationResult handle_push_file(OperationContext &ctx, const json &args) {
  auto local = args.at("local_path").get<std::string>();
  auto remote = args.at("remote_path").get<std::string>();

  ctx.session.push_file(ctx.device(), local, remote, ctx.timeout);

  json out;
  out["local_path"] = local;
  out["remote_path"] = remote;
  out["size"] = std::filesystem::file_size(local);
  return OperationResult::from_json(out);
}

OperationResult handle_get_logs(OperationContext &ctx, const json &args) {
  auto lines = args.at("lines").get<int64_t>();
  auto priority = optional_string(args, "priority");
  auto tag = optional_string(args, "tag");

  std::string command = fmt::format("logcat -d -t {}", lines);
  if (tag && !tag->empty()) {
    command += " " + device::shell_quote(*tag + ":" + priority.value_or("V")) +
               " '*:S'";
  } else if (priority) {
    command += " '*:" + *priority + "'";
  }

  return OperationResult::from_text(
      ctx.session.shell(ctx.device(), command, ctx.timeout));
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

void register_builtin_operations(OperationRegistry &registry) {
  auto op = [](std::string name, std::string description, OutputKind output,
               std::vector<ParamSpec> params, bool requires_device = true) {
    OperationSpec spec;
    spec.name = std::move(name);
    spec.description = std::move(description);
    spec.output = output;
    spec.params = std::move(params);
    spec.requires_device = requires_device;
    return spec;
  };

  const std::vector<ParamSpec> element_params = {
      string_param("text", false, "Exact visible text"),
      string_param("resource_id", false, "Exact resource-id"),
      string_param("class_name", false, "Exact widget class"),
      string_param("content_desc", false, "Exact content description")};
  const std::vector<std::string> element_keys = {"text", "resource_id",
                                                 "class_name", "content_desc"};

  registry.register_operation(
      op("list_operations", "List the available operations", OutputKind::Json,
         {}, false),
      handle_list_operations);

  registry.register_operation(
      op("list_devices", "List attached devices and emulators",
         OutputKind::Json, {}, false),
      handle_list_devices);

  registry.register_operation(
      op("select_device",
         "Make a device the default target for this connection",
         OutputKind::Json, {string_param("serial", true, "Device serial")},
         false),
      handle_select_device);

  registry.register_operation(
      op("get_device_info", "Model, Android version, ABI and screen size",
         OutputKind::Json, {}),
      handle_get_device_info);

  registry.register_operation(
      op("capture_screenshot", "Capture the screen as PNG",
         OutputKind::BinaryArtifact,
         {string_param("save_path", false,
                       "Also write the PNG to this local path")}),
      handle_capture_screenshot);

  registry.register_operation(
      op("get_ui_hierarchy", "Dump the current window hierarchy as XML",
         OutputKind::Text, {}),
      handle_get_ui_hierarchy);

  {
    auto spec = op("find_element", "Find UI elements by exact attributes",
                   OutputKind::Json, element_params);
    spec.require_any = element_keys;
    registry.register_operation(std::move(spec), handle_find_element);
  }

  registry.register_operation(
      op("tap_coordinates", "Tap a screen position", OutputKind::Text,
         {int_param("x", true, "X coordinate", 0),
          int_param("y", true, "Y coordinate", 0)}),
      handle_tap_coordinates);

  {
    auto params = element_params;
    params.push_back(with_default(
        int_param("index", false, "Which match to tap", 0), 0));
    auto spec = op("tap_element", "Tap the centre of a matching UI element",
                   OutputKind::Json, params);
    spec.require_any = element_keys;
    registry.register_operation(std::move(spec), handle_tap_element);
  }

  registry.register_operation(
      op("swipe", "Swipe between two screen positions", OutputKind::Text,
         {int_param("start_x", true, "Start X", 0),
          int_param("start_y", true, "Start Y", 0),
          int_param("end_x", true, "End X", 0),
          int_param("end_y", true, "End Y", 0),
          with_default(int_param("duration_ms", false, "Swipe duration (ms)",
                                 0, 60000),
                       300)}),
      handle_swipe);

  registry.register_operation(
      op("input_text", "Type text into the focused field", OutputKind::Text,
         {single_line(string_param("text", true, "Text to type"))}),
      handle_input_text);

  {
    std::vector<std::string> keys;
    for (const auto &kv : KEY_CODES) {
      keys.push_back(kv.first);
    }
    registry.register_operation(
        op("press_key", "Press a hardware or system key", OutputKind::Text,
           {enum_param("key", true, keys, "Key name")}),
        handle_press_key);
  }

  registry.register_operation(
      op("install_app", "Install or reinstall an APK", OutputKind::Text,
         {local_file(string_param("apk_path", true, "Local APK path"))}),
      handle_install_app);

  registry.register_operation(
      op("launch_app", "Launch an app's launcher activity", OutputKind::Text,
         {matching(string_param("package", true, "Package name"),
                   PACKAGE_PATTERN)}),
      handle_launch_app);

  registry.register_operation(
      op("stop_app", "Force-stop an app", OutputKind::Text,
         {matching(string_param("package", true, "Package name"),
                   PACKAGE_PATTERN)}),
      handle_stop_app);

  registry.register_operation(
      op("clear_app_data", "Clear an app's data and cache", OutputKind::Text,
         {matching(string_param("package", true, "Package name"),
                   PACKAGE_PATTERN)}),
      handle_clear_app_data);

  registry.register_operation(
      op("list_packages", "List installed packages", OutputKind::Json,
         {string_param("filter", false, "Substring filter")}),
      handle_list_packages);

  registry.register_operation(
      op("setup_proxy", "Route device HTTP traffic through a proxy",
         OutputKind::Text,
         {matching(string_param("host", true, "Proxy host"),
                   R"([A-Za-z0-9._:-]+)"),
          int_param("port", true, "Proxy port", 1, 65535)}),
      handle_setup_proxy);

  registry.register_operation(
      op("clear_proxy", "Remove the global HTTP proxy", OutputKind::Text, {}),
      handle_clear_proxy);

  registry.register_operation(
      op("install_certificate",
         "Push a CA certificate to the device for manual installation",
         OutputKind::Text,
         {local_file(string_param("cert_path", true, "Local certificate path")),
          with_default(matching(string_param("cert_name", false,
                                             "File name on the device"),
                                R"([A-Za-z0-9._-]+)"),
                       "ca_cert")}),
      handle_install_certificate);

  {
    auto spec = op("execute_shell", "Run a shell command on the device",
                   OutputKind::Json,
                   {string_param("command", true, "Shell command line")});
    registry.register_operation(std::move(spec), handle_execute_shell);
  }

  registry.register_operation(
      op("pull_file",
         "Copy a device file to local_path and report its size, or without "
         "local_path return it inline as {name, mime_type, size, data} with "
         "base64 data",
         OutputKind::Json,
         {string_param("remote_path", true, "Device path"),
          string_param("local_path", false, "Local destination")}),
      handle_pull_file);

  registry.register_operation(
      op("push_file", "Copy a local file to the device", OutputKind::Json,
         {local_file(string_param("local_path", true, "Local source")),
          string_param("remote_path", true, "Device path")}),
      handle_push_file);

  registry.register_operation(
      op("get_logs", "Recent logcat output", OutputKind::Text,
         {with_default(int_param("lines", false, "Number of lines", 1, 5000),
                       200),
          enum_param("priority", false, {"V", "D", "I", "W", "E", "F"},
                     "Minimum priority"),
          matching(string_param("tag", false, "Only this log tag"),
                   R"([A-Za-z0-9._-]+)")}),
      handle_get_logs);
}

std::shared_ptr<const OperationRegistry> build_default_registry() {
  auto registry = std::make_shared<OperationRegistry>();
  register_builtin_operations(*registry);
  LOG_DEBUG("REGISTRY", "BUILD", "Registered {} operations", registry->size());
  return registry;
}

} // namespace server
} // namespace emuserver
