#pragma once

#include "emulator-server/types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace emuserver {

enum class ErrorKind {
  Validation,
  NoDevice,
  AmbiguousDevice,
  DeviceOffline,
  Process,
  ArtifactTooLarge,
  Internal
};

/// Wire name of an error kind ("ValidationError", "ProcessError", ...)
std::string error_kind_name(ErrorKind kind);

/// Base for every error that is reported to the caller as ok:false
class ServerError : public std::runtime_error {
public:
  ServerError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

  /// {"kind": ..., "message": ..., plus kind-specific detail}
  virtual nlohmann::json to_json() const;

private:
  ErrorKind kind_;
};

enum class ValidationReason {
  UnknownOperation,
  MalformedRequest,
  MissingParam,
  WrongType,
  OutOfRange,
  InvalidValue
};

std::string to_string(ValidationReason reason);

class ValidationError : public ServerError {
public:
  ValidationError(ValidationReason reason, std::string field,
                  const std::string &message)
      : ServerError(ErrorKind::Validation, message), reason_(reason),
        field_(std::move(field)) {}

  ValidationReason reason() const { return reason_; }
  const std::string &field() const { return field_; }

  nlohmann::json to_json() const override;

private:
  ValidationReason reason_;
  std::string field_;
};

class NoDeviceError : public ServerError {
public:
  explicit NoDeviceError(const std::string &message)
      : ServerError(ErrorKind::NoDevice, message) {}
};

class AmbiguousDeviceError : public ServerError {
public:
  explicit AmbiguousDeviceError(const std::string &message)
      : ServerError(ErrorKind::AmbiguousDevice, message) {}
};

class DeviceOfflineError : public ServerError {
public:
  explicit DeviceOfflineError(const std::string &message)
      : ServerError(ErrorKind::DeviceOffline, message) {}
};

enum class ProcessFailure { TimedOut, NotFound, NonZeroExit };

std::string to_string(ProcessFailure failure);

class ProcessError : public ServerError {
public:
  ProcessError(ProcessFailure reason, const std::string &message,
               ProcessResult result = {})
      : ServerError(ErrorKind::Process, message), reason_(reason),
        result_(std::move(result)) {}

  ProcessFailure reason() const { return reason_; }

  /// Whatever was captured before the failure (partial on timeout)
  const ProcessResult &result() const { return result_; }

  nlohmann::json to_json() const override;

private:
  ProcessFailure reason_;
  ProcessResult result_;
};

class ArtifactTooLargeError : public ServerError {
public:
  ArtifactTooLargeError(uint64_t size, uint64_t limit);

  uint64_t size() const { return size_; }
  uint64_t limit() const { return limit_; }

  nlohmann::json to_json() const override;

private:
  uint64_t size_;
  uint64_t limit_;
};

class InternalError : public ServerError {
public:
  explicit InternalError(const std::string &message)
      : ServerError(ErrorKind::Internal, message) {}
};

} // namespace emuserver
