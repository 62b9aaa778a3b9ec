#pragma once

#include "emulator-server/ServerConfig.hpp"
#include "emulator-server/device/DeviceSession.hpp"
#include "emulator-server/server/OperationRegistry.hpp"
#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace emuserver {
namespace server {

/// Loopback TCP listener. Every accepted connection gets its own thread and
/// its own DispatchLoop; only the registry is shared between them.
class RpcServer {
public:
  RpcServer(std::shared_ptr<const OperationRegistry> registry,
            device::DeviceSession &session, const ServerConfig &config);
  ~RpcServer();

  RpcServer(const RpcServer &) = delete;
  RpcServer &operator=(const RpcServer &) = delete;

  // Bind 127.0.0.1:port (0 picks an ephemeral port) and start accepting.
  // Returns false if the socket could not be bound.
  bool start(uint16_t port);

  // Close the listener and every client connection, then join all threads.
  void stop();

  // Bound port (useful if started with 0)
  uint16_t port() const { return bound_port_; }

  bool is_running() const { return running_; }

  size_t active_connections() const;

private:
  struct Client {
    int fd{-1};
    std::string id;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void accept_loop();
  void serve_client(Client *client);
  void reap_finished_clients();

  std::shared_ptr<const OperationRegistry> registry_;
  device::DeviceSession &session_;
  const ServerConfig &config_;

  std::atomic<bool> running_{false};
  std::thread server_thread_;
  int listen_fd_{-1};
  uint16_t bound_port_{0};

  mutable std::mutex clients_mutex_;
  std::list<std::unique_ptr<Client>> clients_;
  uint64_t next_client_id_{1};
};

} // namespace server
} // namespace emuserver
