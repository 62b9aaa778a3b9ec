#pragma once

#include "emulator-server/server/OperationContext.hpp"
#include "emulator-server/server/ParamValidator.hpp"
#include "emulator-server/server/ResultEncoder.hpp"
#include "emulator-server/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace emuserver {
namespace server {

using OperationHandler =
    std::function<OperationResult(OperationContext &, const nlohmann::json &)>;

struct OperationEntry {
  OperationSpec spec;
  OperationHandler handler;
};

/// Name -> {spec, handler} table.
///
/// Built once at startup and then shared read-only (see
/// build_default_registry); lookups take no lock.
class OperationRegistry {
public:
  /// Throws std::logic_error on a duplicate name or an empty handler.
  /// Device-requiring operations gain optional `device` and `timeout_s`.
  void register_operation(OperationSpec spec, OperationHandler handler);

  /// nullptr when the name is unknown
  const OperationEntry *lookup(const std::string &name) const;

  /// Specs in registration order
  std::vector<const OperationSpec *> describe_all() const;

  nlohmann::json describe_json() const;

  /// Lookup plus argument validation. Throws ValidationError.
  ValidationResult validate(const std::string &name,
                            const nlohmann::json &args) const;

  size_t size() const { return entries_.size(); }

private:
  std::vector<std::unique_ptr<OperationEntry>> entries_;
  std::map<std::string, const OperationEntry *> by_name_;
};

/// JSON description of one operation (as listed by list_operations)
nlohmann::json describe_operation(const OperationSpec &spec);

} // namespace server
} // namespace emuserver
