#include "emulator-server/server/Transport.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace emuserver {
namespace server {

FdTransport::FdTransport(int read_fd, int write_fd, bool is_socket)
    : read_fd_(read_fd), write_fd_(write_fd), is_socket_(is_socket) {}

std::optional<std::string> FdTransport::read_message() {
  size_t scanned = 0;
  while (true) {
    auto nl = buffer_.find('\n', scanned);
    if (nl != std::string::npos) {
      std::string line = buffer_.substr(0, nl);
      buffer_.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return line;
    }
    scanned = buffer_.size();

    if (eof_) {
      if (buffer_.empty())
        return std::nullopt;
      // Last line without a terminator
      std::string line;
      line.swap(buffer_);
      return line;
    }

    if (buffer_.size() > MAX_LINE_BYTES) {
      throw std::system_error(EMSGSIZE, std::generic_category(),
                              "request line too long");
    }

    char chunk[8192];
    ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "read");
    }
    if (n == 0) {
      eof_ = true;
      continue;
    }
    buffer_.append(chunk, static_cast<size_t>(n));
  }
}

void FdTransport::write_message(const std::string &message) {
  std::string out = message;
  out += '\n';

  size_t sent = 0;
  while (sent < out.size()) {
    ssize_t w;
    if (is_socket_) {
      w = ::send(write_fd_, out.data() + sent, out.size() - sent,
                 MSG_NOSIGNAL);
    } else {
      w = ::write(write_fd_, out.data() + sent, out.size() - sent);
    }
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "write");
    }
    sent += static_cast<size_t>(w);
  }
}

} // namespace server
} // namespace emuserver
