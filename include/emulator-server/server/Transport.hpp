#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace emuserver {
namespace server {

/// Bidirectional message channel carrying one JSON document per line
class Transport {
public:
  virtual ~Transport() = default;

  /// Next line without its terminator; std::nullopt at end of stream.
  /// Throws std::system_error on I/O failure.
  virtual std::optional<std::string> read_message() = 0;

  /// Write one line (terminator added). Throws std::system_error.
  virtual void write_message(const std::string &message) = 0;
};

/// Line transport over a pair of file descriptors (stdin/stdout, or the
/// same socket twice)
class FdTransport : public Transport {
public:
  static constexpr size_t MAX_LINE_BYTES = 64 * 1024 * 1024;

  /// Sockets are written with send(MSG_NOSIGNAL) so a vanished peer is an
  /// error, not SIGPIPE. The descriptors are not closed.
  FdTransport(int read_fd, int write_fd, bool is_socket = false);

  std::optional<std::string> read_message() override;
  void write_message(const std::string &message) override;

private:
  int read_fd_;
  int write_fd_;
  bool is_socket_;
  std::string buffer_;
  bool eof_{false};
};

} // namespace server
} // namespace emuserver
