#pragma once

#include "emulator-server/ServerConfig.hpp"
#include "emulator-server/device/DeviceSession.hpp"
#include "emulator-server/types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace emuserver {
namespace server {

class OperationRegistry;

/// Per-connection state. Never shared between connections.
struct ConnectionState {
  std::string connection_id;
  // Set by the select_device operation
  std::optional<std::string> selected_device;
};

/// Everything a handler may touch while serving one request
struct OperationContext {
  device::DeviceSession &session;
  const ServerConfig &config;
  ConnectionState &connection;
  const OperationRegistry &registry;
  // Resolved before the handler runs for device-requiring operations
  std::optional<DeviceTarget> target;
  std::chrono::milliseconds timeout;

  const DeviceTarget &device() const;
};

} // namespace server
} // namespace emuserver
