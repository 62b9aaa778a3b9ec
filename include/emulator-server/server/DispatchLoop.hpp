#pragma once

#include "emulator-server/Errors.hpp"
#include "emulator-server/ServerConfig.hpp"
#include "emulator-server/device/DeviceSession.hpp"
#include "emulator-server/server/OperationContext.hpp"
#include "emulator-server/server/OperationRegistry.hpp"
#include "emulator-server/server/Transport.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace emuserver {
namespace server {

enum class DispatchState {
  AwaitingRequest,
  Validating,
  Executing,
  Encoding,
  Closed
};

std::string to_string(DispatchState state);

/// Request/response loop for one connection.
///
/// One request is in flight at a time: the next line is read only after the
/// previous response has been written. Handler failures of any kind become
/// ok:false responses; only transport errors end the loop.
class DispatchLoop {
public:
  DispatchLoop(std::shared_ptr<const OperationRegistry> registry,
               device::DeviceSession &session, const ServerConfig &config,
               std::string connection_id = "stdio");

  /// Serve until end of stream or transport failure
  void run(Transport &transport);

  /// Handle one raw request line and return the response document
  nlohmann::json handle_message(const std::string &line);

  /// Handle one parsed request
  nlohmann::json handle_request(const nlohmann::json &request);

  DispatchState state() const { return state_; }
  const ConnectionState &connection() const { return connection_; }
  size_t requests_served() const { return requests_served_; }

private:
  nlohmann::json execute(const nlohmann::json &request);
  DeviceTarget resolve_target(const nlohmann::json &args,
                              std::chrono::milliseconds timeout);

  std::shared_ptr<const OperationRegistry> registry_;
  device::DeviceSession &session_;
  const ServerConfig &config_;
  ConnectionState connection_;
  DispatchState state_{DispatchState::AwaitingRequest};
  size_t requests_served_{0};
};

/// {"ok": false, "error": {...}} for a ServerError
nlohmann::json make_error_response(const ServerError &error);

/// Serialize a response; invalid UTF-8 from device output is replaced
std::string dump_response(const nlohmann::json &response);

} // namespace server
} // namespace emuserver
