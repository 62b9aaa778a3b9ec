#include "emulator-server/server/OperationRegistry.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"

#include <stdexcept>

namespace emuserver {
namespace server {

namespace {

constexpr double MAX_TIMEOUT_S = 3600;

nlohmann::json describe_param(const ParamSpec &param) {
  nlohmann::json j;
  j["name"] = param.name;
  j["type"] = to_string(param.type);
  j["required"] = param.required;
  if (param.default_value) {
    j["default"] = *param.default_value;
  }
  if (!param.allowed.empty()) {
    j["allowed"] = param.allowed;
  }
  if (param.min) {
    j["min"] = *param.min;
  }
  if (param.max) {
    j["max"] = *param.max;
  }
  if (!param.description.empty()) {
    j["description"] = param.description;
  }
  return j;
}

} // namespace

const DeviceTarget &OperationContext::device() const {
  if (!target) {
    throw InternalError("operation needs a device but none was resolved");
  }
  return *target;
}

nlohmann::json describe_operation(const OperationSpec &spec) {
  nlohmann::json j;
  j["name"] = spec.name;
  j["description"] = spec.description;
  j["output"] = to_string(spec.output);
  j["requires_device"] = spec.requires_device;
  j["params"] = nlohmann::json::array();
  for (const auto &p : spec.params) {
    j["params"].push_back(describe_param(p));
  }
  if (!spec.require_any.empty()) {
    j["require_any"] = spec.require_any;
  }
  return j;
}

void OperationRegistry::register_operation(OperationSpec spec,
                                           OperationHandler handler) {
  if (spec.name.empty()) {
    throw std::logic_error("operation name must not be empty");
  }
  if (by_name_.count(spec.name)) {
    throw std::logic_error("operation '" + spec.name +
                           "' is registered twice");
  }
  if (!handler) {
    throw std::logic_error("operation '" + spec.name + "' has no handler");
  }

  if (spec.requires_device) {
    if (!spec.find_param("device")) {
      ParamSpec device;
      device.name = "device";
      device.type = ParamType::String;
      device.description = "Serial of the device to use";
      spec.params.push_back(device);
    }
    if (!spec.find_param("timeout_s")) {
      ParamSpec timeout;
      timeout.name = "timeout_s";
      timeout.type = ParamType::Integer;
      timeout.min = 1;
      timeout.max = MAX_TIMEOUT_S;
      timeout.description = "Per-call timeout for bridge commands (seconds)";
      spec.params.push_back(timeout);
    }
  }

  for (const auto &name : spec.require_any) {
    if (!spec.find_param(name)) {
      throw std::logic_error("operation '" + spec.name +
                             "' requires unknown parameter '" + name + "'");
    }
  }

  auto entry = std::make_unique<OperationEntry>();
  entry->spec = std::move(spec);
  entry->handler = std::move(handler);
  by_name_[entry->spec.name] = entry.get();
  entries_.push_back(std::move(entry));
}

const OperationEntry *
OperationRegistry::lookup(const std::string &name) const {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : it->second;
}

std::vector<const OperationSpec *> OperationRegistry::describe_all() const {
  std::vector<const OperationSpec *> specs;
  specs.reserve(entries_.size());
  for (const auto &e : entries_) {
    specs.push_back(&e->spec);
  }
  return specs;
}

nlohmann::json OperationRegistry::describe_json() const {
  nlohmann::json ops = nlohmann::json::array();
  for (const auto &e : entries_) {
    ops.push_back(describe_operation(e->spec));
  }
  return {{"operations", ops}, {"count", entries_.size()}};
}

ValidationResult OperationRegistry::validate(const std::string &name,
                                             const nlohmann::json &args) const {
  const auto *entry = lookup(name);
  if (!entry) {
    throw ValidationError(ValidationReason::UnknownOperation, "op",
                          "unknown operation '" + name + "'");
  }
  auto result = ParamValidator::validate(entry->spec, args);
  for (const auto &key : result.ignored) {
    LOG_DEBUG("REGISTRY", name, "Ignoring undeclared argument '{}'", key);
  }
  return result;
}

} // namespace server
} // namespace emuserver
