#include "emulator-server/server/ParamValidator.hpp"
#include "emulator-server/Errors.hpp"

#include <cmath>
#include <filesystem>
#include <fmt/format.h>
#include <regex>

namespace emuserver {
namespace server {

namespace {

// Whole string is a decimal number, optional sign, fraction and exponent
bool parse_numeric(const std::string &text, double &out) {
  static const std::regex numeric_re(
      R"(^\s*[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?\s*$)");
  if (!std::regex_match(text, numeric_re))
    return false;
  try {
    out = std::stod(text);
  } catch (const std::out_of_range &) {
    return false;
  }
  return std::isfinite(out);
}

[[noreturn]] void wrong_type(const ParamSpec &param,
                             const nlohmann::json &value) {
  throw ValidationError(ValidationReason::WrongType, param.name,
                        fmt::format("parameter '{}' must be {}, got {}",
                                    param.name, to_string(param.type),
                                    value.type_name()));
}

void check_bounds(const ParamSpec &param, double value) {
  if (param.min && value < *param.min) {
    throw ValidationError(ValidationReason::OutOfRange, param.name,
                          fmt::format("parameter '{}' must be >= {}, got {}",
                                      param.name, *param.min, value));
  }
  if (param.max && value > *param.max) {
    throw ValidationError(ValidationReason::OutOfRange, param.name,
                          fmt::format("parameter '{}' must be <= {}, got {}",
                                      param.name, *param.max, value));
  }
}

std::string join(const std::vector<std::string> &names,
                 const std::string &sep) {
  std::string out;
  for (const auto &n : names) {
    if (!out.empty())
      out += sep;
    out += n;
  }
  return out;
}

bool is_present(const nlohmann::json &args, const std::string &name) {
  auto it = args.find(name);
  return it != args.end() && !it->is_null();
}

} // namespace

nlohmann::json ParamValidator::coerce(const ParamSpec &param,
                                      const nlohmann::json &value) {
  switch (param.type) {
  case ParamType::String: {
    if (!value.is_string())
      wrong_type(param, value);
    const auto &s = value.get_ref<const std::string &>();
    if (!param.pattern.empty() &&
        !std::regex_match(s, std::regex(param.pattern))) {
      throw ValidationError(
          ValidationReason::InvalidValue, param.name,
          fmt::format("parameter '{}' has an invalid value '{}'", param.name,
                      s));
    }
    if (param.single_line) {
      for (char c : s) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
          throw ValidationError(
              ValidationReason::InvalidValue, param.name,
              fmt::format("parameter '{}' must not contain control characters",
                          param.name));
        }
      }
    }
    if (param.existing_file && !std::filesystem::is_regular_file(s)) {
      throw ValidationError(ValidationReason::InvalidValue, param.name,
                            fmt::format("file not found: {}", s));
    }
    return value;
  }

  case ParamType::Integer: {
    double number = 0;
    if (value.is_number_integer()) {
      auto i = value.get<int64_t>();
      check_bounds(param, static_cast<double>(i));
      return i;
    }
    if (value.is_number_float()) {
      number = value.get<double>();
      if (!std::isfinite(number))
        wrong_type(param, value);
    } else if (value.is_string()) {
      if (!parse_numeric(value.get<std::string>(), number))
        wrong_type(param, value);
    } else {
      wrong_type(param, value);
    }
    number = std::trunc(number);
    check_bounds(param, number);
    if (std::fabs(number) > 9.0e15) {
      throw ValidationError(ValidationReason::OutOfRange, param.name,
                            "parameter '" + param.name +
                                "' is too large for an integer");
    }
    return static_cast<int64_t>(number);
  }

  case ParamType::Number: {
    double number = 0;
    if (value.is_number()) {
      number = value.get<double>();
    } else if (!value.is_string() ||
               !parse_numeric(value.get<std::string>(), number)) {
      wrong_type(param, value);
    }
    check_bounds(param, number);
    return number;
  }

  case ParamType::Boolean:
    if (value.is_boolean())
      return value;
    if (value.is_string()) {
      const auto &s = value.get_ref<const std::string &>();
      if (s == "true")
        return true;
      if (s == "false")
        return false;
    }
    wrong_type(param, value);

  case ParamType::Enum: {
    if (!value.is_string())
      wrong_type(param, value);
    const auto &s = value.get_ref<const std::string &>();
    for (const auto &allowed : param.allowed) {
      if (allowed == s)
        return value;
    }
    throw ValidationError(
        ValidationReason::InvalidValue, param.name,
        fmt::format("parameter '{}' must be one of [{}], got '{}'", param.name,
                    join(param.allowed, ", "), s));
  }
  }
  wrong_type(param, value);
}

ValidationResult ParamValidator::validate(const OperationSpec &spec,
                                          const nlohmann::json &args) {
  if (!args.is_null() && !args.is_object()) {
    throw ValidationError(ValidationReason::MalformedRequest, "args",
                          "'args' must be an object");
  }
  const nlohmann::json input = args.is_null() ? nlohmann::json::object() : args;

  ValidationResult result;
  result.args = nlohmann::json::object();

  for (const auto &param : spec.params) {
    if (!is_present(input, param.name)) {
      if (param.required) {
        throw ValidationError(
            ValidationReason::MissingParam, param.name,
            fmt::format("missing required parameter '{}' for '{}'", param.name,
                        spec.name));
      }
      if (param.default_value) {
        result.args[param.name] = *param.default_value;
      }
      continue;
    }
    result.args[param.name] = coerce(param, input.at(param.name));
  }

  if (!spec.require_any.empty()) {
    bool any = false;
    for (const auto &name : spec.require_any) {
      any = any || is_present(result.args, name);
    }
    if (!any) {
      std::string fields = join(spec.require_any, "|");
      throw ValidationError(
          ValidationReason::MissingParam, fields,
          fmt::format("'{}' needs at least one of: {}", spec.name,
                      join(spec.require_any, ", ")));
    }
  }

  for (auto it = input.begin(); it != input.end(); ++it) {
    if (!spec.find_param(it.key())) {
      result.ignored.push_back(it.key());
    }
  }

  return result;
}

} // namespace server
} // namespace emuserver
