#include "emulator-server/Errors.hpp"
#include <fmt/format.h>

namespace emuserver {

std::string to_string(ParamType type) {
  switch (type) {
  case ParamType::String:
    return "string";
  case ParamType::Integer:
    return "integer";
  case ParamType::Number:
    return "number";
  case ParamType::Boolean:
    return "boolean";
  case ParamType::Enum:
    return "enum";
  }
  return "unknown";
}

std::string to_string(OutputKind kind) {
  switch (kind) {
  case OutputKind::Text:
    return "text";
  case OutputKind::Json:
    return "json";
  case OutputKind::BinaryArtifact:
    return "binary-artifact";
  }
  return "unknown";
}

std::string error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "ValidationError";
  case ErrorKind::NoDevice:
    return "NoDeviceError";
  case ErrorKind::AmbiguousDevice:
    return "AmbiguousDeviceError";
  case ErrorKind::DeviceOffline:
    return "DeviceOfflineError";
  case ErrorKind::Process:
    return "ProcessError";
  case ErrorKind::ArtifactTooLarge:
    return "ArtifactTooLargeError";
  case ErrorKind::Internal:
    return "InternalError";
  }
  return "InternalError";
}

std::string to_string(ValidationReason reason) {
  switch (reason) {
  case ValidationReason::UnknownOperation:
    return "unknownOperation";
  case ValidationReason::MalformedRequest:
    return "malformedRequest";
  case ValidationReason::MissingParam:
    return "missingParam";
  case ValidationReason::WrongType:
    return "wrongType";
  case ValidationReason::OutOfRange:
    return "outOfRange";
  case ValidationReason::InvalidValue:
    return "invalidValue";
  }
  return "unknown";
}

std::string to_string(ProcessFailure failure) {
  switch (failure) {
  case ProcessFailure::TimedOut:
    return "TimedOut";
  case ProcessFailure::NotFound:
    return "NotFound";
  case ProcessFailure::NonZeroExit:
    return "NonZeroExit";
  }
  return "unknown";
}

nlohmann::json ServerError::to_json() const {
  return {{"kind", error_kind_name(kind_)}, {"message", what()}};
}

nlohmann::json ValidationError::to_json() const {
  auto j = ServerError::to_json();
  j["reason"] = to_string(reason_);
  if (!field_.empty()) {
    j["field"] = field_;
  }
  return j;
}

nlohmann::json ProcessError::to_json() const {
  auto j = ServerError::to_json();
  j["reason"] = to_string(reason_);
  if (reason_ == ProcessFailure::NonZeroExit) {
    j["exit_code"] = result_.exit_code;
  }
  return j;
}

ArtifactTooLargeError::ArtifactTooLargeError(uint64_t size, uint64_t limit)
    : ServerError(ErrorKind::ArtifactTooLarge,
                  fmt::format("artifact is {} bytes, limit is {} bytes", size,
                              limit)),
      size_(size), limit_(limit) {}

nlohmann::json ArtifactTooLargeError::to_json() const {
  auto j = ServerError::to_json();
  j["size"] = size_;
  j["limit"] = limit_;
  return j;
}

} // namespace emuserver
