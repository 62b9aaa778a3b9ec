#pragma once
#include "emulator-server/types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emuserver {
namespace ipc {

struct ProcessRequest {
  std::string program; // bare names are searched on PATH
  std::vector<std::string> args;
  std::optional<std::string> working_dir;
  std::optional<std::chrono::milliseconds> timeout; // none = wait forever
  bool check_exit{true}; // throw NonZeroExit instead of returning the code
};

/// Runs external commands to completion.
///
/// Implementations throw ProcessError with reason TimedOut, NotFound or
/// NonZeroExit. No retries happen at this layer.
class ProcessExecutor {
public:
  virtual ~ProcessExecutor() = default;

  virtual ProcessResult execute(const ProcessRequest &request) = 0;
};

/// fork/exec implementation with pipes, a per-call deadline and a global cap
/// on concurrently running children.
///
/// Each child runs in its own process group. On timeout the group is killed
/// and reaped before the error is thrown; no exit path leaves a zombie.
class PosixProcessExecutor : public ProcessExecutor {
public:
  explicit PosixProcessExecutor(size_t max_concurrent = 4);

  ProcessResult execute(const ProcessRequest &request) override;

  size_t max_concurrent() const { return max_concurrent_; }

  /// Highest number of children seen running at once
  size_t peak_running() const;

private:
  class SlotGuard;

  void acquire_slot();
  void release_slot();

  size_t max_concurrent_;
  mutable std::mutex mutex_;
  std::condition_variable slot_cv_;
  size_t running_{0};
  size_t peak_running_{0};
};

/// Human readable command line for logs and error messages
std::string format_command(const ProcessRequest &request);

} // namespace ipc
} // namespace emuserver
