#pragma once

#include "emulator-server/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace emuserver {
namespace server {

struct ValidationResult {
  // Coerced arguments with defaults filled in; only declared params appear
  nlohmann::json args;
  // Argument keys the operation does not declare
  std::vector<std::string> ignored;
};

/// Checks request arguments against an OperationSpec.
///
/// All checks are local; nothing here runs an external process. Failures
/// throw ValidationError naming the offending field.
class ParamValidator {
public:
  static ValidationResult validate(const OperationSpec &spec,
                                   const nlohmann::json &args);

  /// Coerce one present value to the declared type and check its bounds
  static nlohmann::json coerce(const ParamSpec &param,
                               const nlohmann::json &value);
};

} // namespace server
} // namespace emuserver
