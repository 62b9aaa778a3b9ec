#include "emulator-server/server/RpcServer.hpp"
#include "emulator-server/Logger.hpp"
#include "emulator-server/server/DispatchLoop.hpp"
#include "emulator-server/server/Transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace emuserver {
namespace server {

namespace {
constexpr int BACKLOG = 16;
} // namespace

RpcServer::RpcServer(std::shared_ptr<const OperationRegistry> registry,
                     device::DeviceSession &session,
                     const ServerConfig &config)
    : registry_(std::move(registry)), session_(session), config_(config) {}

RpcServer::~RpcServer() { stop(); }

bool RpcServer::start(uint16_t port) {
  if (running_.exchange(true)) {
    // already running
    return true;
  }

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    LOG_ERROR("RPC", "SOCKET", "Failed to create socket: {}",
              std::strerror(errno));
    running_ = false;
    return false;
  }

  // Allow immediate reuse
  int opt = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr),
             sizeof(addr)) < 0) {
    LOG_ERROR("RPC", "BIND", "bind to 127.0.0.1:{} failed: {}", port,
              std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    running_ = false;
    return false;
  }

  if (::listen(listen_fd_, BACKLOG) < 0) {
    LOG_ERROR("RPC", "LISTEN", "listen failed: {}", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    running_ = false;
    return false;
  }

  // If port was 0, query assigned port
  bound_port_ = port;
  if (port == 0) {
    struct sockaddr_in sin;
    socklen_t len = sizeof(sin);
    if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr *>(&sin),
                      &len) == 0) {
      bound_port_ = ntohs(sin.sin_port);
    }
  }

  LOG_INFO("RPC", "START", "Listening on 127.0.0.1:{}", bound_port_);
  server_thread_ = std::thread(&RpcServer::accept_loop, this);
  return true;
}

void RpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // shutdown() unblocks the accept() call
  if (listen_fd_ >= 0) {
    ::shutdown(listen_fd_, SHUT_RDWR);
  }
  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  std::list<std::unique_ptr<Client>> clients;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients.swap(clients_);
  }
  for (auto &client : clients) {
    // Unblocks the client's pending read; an in-flight request finishes
    // first (bounded by the process timeout)
    ::shutdown(client->fd, SHUT_RDWR);
  }
  for (auto &client : clients) {
    if (client->thread.joinable()) {
      client->thread.join();
    }
    ::close(client->fd);
  }

  LOG_INFO("RPC", "STOP", "RPC server stopped");
}

size_t RpcServer::active_connections() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  size_t n = 0;
  for (const auto &client : clients_) {
    if (!client->done)
      ++n;
  }
  return n;
}

void RpcServer::accept_loop() {
  while (running_) {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int fd = ::accept4(listen_fd_,
                       reinterpret_cast<struct sockaddr *>(&client_addr),
                       &client_len, SOCK_CLOEXEC);
    if (fd < 0) {
      if (!running_)
        break;
      if (errno == EINTR)
        continue;
      LOG_WARN("RPC", "ACCEPT", "accept failed: {}", std::strerror(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    reap_finished_clients();

    std::lock_guard<std::mutex> lock(clients_mutex_);
    if (!running_) {
      ::close(fd);
      break;
    }
    auto client = std::make_unique<Client>();
    client->fd = fd;
    client->id = "conn-" + std::to_string(next_client_id_++);
    LOG_DEBUG("RPC", client->id, "Accepted from {}:{}",
              inet_ntoa(client_addr.sin_addr), ntohs(client_addr.sin_port));
    client->thread = std::thread(&RpcServer::serve_client, this, client.get());
    clients_.push_back(std::move(client));
  }
}

void RpcServer::serve_client(Client *client) {
  FdTransport transport(client->fd, client->fd, true);
  DispatchLoop loop(registry_, session_, config_, client->id);
  loop.run(transport);
  client->done = true;
}

void RpcServer::reap_finished_clients() {
  std::list<std::unique_ptr<Client>> finished;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if ((*it)->done) {
        finished.push_back(std::move(*it));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &client : finished) {
    client->thread.join();
    ::close(client->fd);
  }
}

} // namespace server
} // namespace emuserver
