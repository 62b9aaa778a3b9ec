#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace emuserver {

enum class ParamType { String, Integer, Number, Boolean, Enum };

enum class OutputKind { Text, Json, BinaryArtifact };

struct ParamSpec {
  std::string name;
  ParamType type{ParamType::String};
  bool required{false};
  std::optional<nlohmann::json> default_value;
  std::vector<std::string> allowed; // enum values
  std::optional<double> min;
  std::optional<double> max;
  std::string description;
  // ECMAScript regex a string value must fully match (empty = any)
  std::string pattern;
  // String naming a local file that must exist
  bool existing_file{false};
  // String may not contain control characters (it ends up on a device shell)
  bool single_line{false};
};

struct OperationSpec {
  std::string name;
  std::string description;
  std::vector<ParamSpec> params;
  OutputKind output{OutputKind::Text};
  bool requires_device{true};
  // At least one of these params must be present (empty = no constraint)
  std::vector<std::string> require_any;

  const ParamSpec *find_param(const std::string &param_name) const {
    for (const auto &p : params) {
      if (p.name == param_name)
        return &p;
    }
    return nullptr;
  }
};

struct DeviceTarget {
  std::string serial;
  std::string state; // "device", "offline", "unauthorized", ...
  std::map<std::string, std::string> details; // model:, product:, ...

  bool is_ready() const { return state == "device"; }
};

/// Transient payload produced by an operation (image, pulled file, dump)
struct Artifact {
  std::string name;
  std::string mime_type{"application/octet-stream"};
  std::vector<uint8_t> bytes;

  size_t size() const { return bytes.size(); }
  std::string as_text() const { return std::string(bytes.begin(), bytes.end()); }
};

/// Captured outcome of one external command
struct ProcessResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{-1};
  std::chrono::milliseconds duration{0};
};

std::string to_string(ParamType type);
std::string to_string(OutputKind kind);

} // namespace emuserver
