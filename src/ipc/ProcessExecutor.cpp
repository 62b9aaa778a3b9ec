#include "emulator-server/ipc/ProcessExecutor.hpp"
#include "emulator-server/Errors.hpp"
#include "emulator-server/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace emuserver {
namespace ipc {

namespace {

// Output still buffered in the pipes after the child exits is drained for at
// most this long (a daemonized grandchild may hold the write ends open).
constexpr std::chrono::milliseconds POST_EXIT_DRAIN{200};

enum ChildStage : int { STAGE_CHDIR = 1, STAGE_EXEC = 2 };

struct ChildFailure {
  int stage;
  int error;
};

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  void reset(int fd = -1) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_{-1};
};

bool make_pipe(UniqueFd &read_end, UniqueFd &write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0)
    return false;
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

/// Owns a spawned child. Destruction kills the child's process group if it
/// is still running and always reaps it.
class ChildProcess {
public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}

  ~ChildProcess() {
    if (pid_ > 0 && !reaped_) {
      kill_group();
      wait_blocking();
    }
  }

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  pid_t pid() const { return pid_; }
  bool reaped() const { return reaped_; }

  void kill_group() {
    if (pid_ > 0 && !reaped_) {
      // Negative pid signals the whole group created by setpgid in the child
      if (::kill(-pid_, SIGKILL) != 0)
        ::kill(pid_, SIGKILL);
    }
  }

  bool try_reap() {
    if (reaped_)
      return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      record(status);
      return true;
    }
    if (r < 0 && errno == ECHILD) {
      reaped_ = true;
    }
    return reaped_;
  }

  void wait_blocking() {
    if (reaped_)
      return;
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
      record(status);
    } else {
      reaped_ = true;
    }
  }

  int exit_code() const { return exit_code_; }

private:
  void record(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
      exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code_ = 128 + WTERMSIG(status);
    } else {
      exit_code_ = -1;
    }
  }

  pid_t pid_;
  bool reaped_{false};
  int exit_code_{-1};
};

// Returns false once the pipe reached EOF or failed
bool drain_pipe(int fd, std::string &out) {
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags != -1)
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string first_line(const std::string &text) {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = text.find_first_of("\r\n", start);
  return text.substr(start, end == std::string::npos ? std::string::npos
                                                      : end - start);
}

} // namespace

std::string format_command(const ProcessRequest &request) {
  std::string out = request.program;
  for (const auto &arg : request.args) {
    out += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      out += '\'' + arg + '\'';
    } else {
      out += arg;
    }
  }
  return out;
}

class PosixProcessExecutor::SlotGuard {
public:
  explicit SlotGuard(PosixProcessExecutor &owner) : owner_(owner) {
    owner_.acquire_slot();
  }
  ~SlotGuard() { owner_.release_slot(); }

  SlotGuard(const SlotGuard &) = delete;
  SlotGuard &operator=(const SlotGuard &) = delete;

private:
  PosixProcessExecutor &owner_;
};

PosixProcessExecutor::PosixProcessExecutor(size_t max_concurrent)
    : max_concurrent_(std::max<size_t>(1, max_concurrent)) {}

void PosixProcessExecutor::acquire_slot() {
  std::unique_lock<std::mutex> lock(mutex_);
  slot_cv_.wait(lock, [this] { return running_ < max_concurrent_; });
  ++running_;
  peak_running_ = std::max(peak_running_, running_);
}

void PosixProcessExecutor::release_slot() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --running_;
  }
  slot_cv_.notify_one();
}

size_t PosixProcessExecutor::peak_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_running_;
}

ProcessResult PosixProcessExecutor::execute(const ProcessRequest &request) {
  const std::string command_line = format_command(request);
  SlotGuard slot(*this);

  LOG_DEBUG("PROCESS", "EXEC", "Running: {}", command_line);

  // Everything the child touches is prepared before fork()
  std::vector<std::string> argv_storage;
  argv_storage.reserve(request.args.size() + 1);
  argv_storage.push_back(request.program);
  argv_storage.insert(argv_storage.end(), request.args.begin(),
                      request.args.end());
  std::vector<char *> argv;
  for (auto &arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const char *cwd =
      request.working_dir ? request.working_dir->c_str() : nullptr;

  UniqueFd out_read, out_write, err_read, err_write, fail_read, fail_write;
  if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) ||
      !make_pipe(fail_read, fail_write)) {
    throw InternalError(std::string("failed to create pipes: ") +
                        std::strerror(errno));
  }

  const auto started = std::chrono::steady_clock::now();
  pid_t pid = ::fork();
  if (pid < 0) {
    throw InternalError(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(err_write.get(), STDERR_FILENO);

    ChildFailure failure{STAGE_CHDIR, 0};
    if (cwd && ::chdir(cwd) != 0) {
      failure.error = errno;
      ssize_t ignored = ::write(fail_write.get(), &failure, sizeof(failure));
      (void)ignored;
      ::_exit(126);
    }
    ::execvp(argv[0], argv.data());
    failure.stage = STAGE_EXEC;
    failure.error = errno;
    ssize_t ignored = ::write(fail_write.get(), &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
  }

  ChildProcess child(pid);
  // Also set from the parent so kill(-pid) is valid before the child runs
  ::setpgid(pid, pid);

  out_write.reset();
  err_write.reset();
  fail_write.reset();

  // Blocks until exec succeeds (EOF via O_CLOEXEC) or the child reports why
  ChildFailure failure{0, 0};
  ssize_t n;
  do {
    n = ::read(fail_read.get(), &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(failure))) {
    child.wait_blocking();
    if (failure.stage == STAGE_CHDIR) {
      throw ProcessError(ProcessFailure::NotFound,
                         fmt::format("working directory {} unusable: {}",
                                     *request.working_dir,
                                     std::strerror(failure.error)));
    }
    LOG_WARN("PROCESS", "EXEC", "Cannot execute {}: {}", request.program,
             std::strerror(failure.error));
    throw ProcessError(ProcessFailure::NotFound,
                       fmt::format("cannot execute {}: {}", request.program,
                                   std::strerror(failure.error)));
  }
  fail_read.reset();

  set_nonblocking(out_read.get());
  set_nonblocking(err_read.get());

  ProcessResult result;
  bool out_open = true;
  bool err_open = true;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (request.timeout) {
    deadline = started + *request.timeout;
  }
  std::optional<std::chrono::steady_clock::time_point> drain_until;

  while (true) {
    auto now = std::chrono::steady_clock::now();

    if (!child.reaped() && child.try_reap()) {
      drain_until = now + POST_EXIT_DRAIN;
    }
    if (child.reaped() && ((!out_open && !err_open) || now >= *drain_until)) {
      break;
    }

    if (!child.reaped() && deadline && now >= *deadline) {
      child.kill_group();
      child.wait_blocking();
      if (out_open)
        drain_pipe(out_read.get(), result.stdout_text);
      if (err_open)
        drain_pipe(err_read.get(), result.stderr_text);
      result.exit_code = child.exit_code();
      result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      LOG_WARN("PROCESS", "TIMEOUT", "Killed after {}ms: {}",
               request.timeout->count(), command_line);
      throw ProcessError(ProcessFailure::TimedOut,
                         fmt::format("{} timed out after {}ms", command_line,
                                     request.timeout->count()),
                         std::move(result));
    }

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) {
      fds[nfds].fd = out_read.get();
      fds[nfds].events = POLLIN;
      ++nfds;
    }
    if (err_open) {
      fds[nfds].fd = err_read.get();
      fds[nfds].events = POLLIN;
      ++nfds;
    }

    // Short slices so child exit and the deadline are noticed promptly
    int wait_ms = 50;
    if (deadline && !child.reaped()) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           *deadline - now)
                           .count();
      wait_ms = static_cast<int>(std::clamp<long long>(remaining, 0, 50));
    }
    if (nfds > 0) {
      ::poll(fds, nfds, wait_ms);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }

    if (out_open && !drain_pipe(out_read.get(), result.stdout_text)) {
      out_open = false;
      out_read.reset();
    }
    if (err_open && !drain_pipe(err_read.get(), result.stderr_text)) {
      err_open = false;
      err_read.reset();
    }
  }

  result.exit_code = child.exit_code();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  LOG_DEBUG("PROCESS", "EXIT", "exit={} in {}ms: {}", result.exit_code,
            result.duration.count(), command_line);

  if (request.check_exit && result.exit_code != 0) {
    std::string detail = first_line(result.stderr_text);
    if (detail.empty())
      detail = first_line(result.stdout_text);
    throw ProcessError(ProcessFailure::NonZeroExit,
                       fmt::format("{} exited with code {}{}{}", command_line,
                                   result.exit_code, detail.empty() ? "" : ": ",
                                   detail),
                       std::move(result));
  }

  return result;
}

} // namespace ipc
} // namespace emuserver
