// Repository: Jukebox-controller
// Component: Subprocess
// Purpose: fork/exec helpers for the external CLI tools and players.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_SUBPROCESS_HPP_
#define JUKEBOX_BACKENDS_SUBPROCESS_HPP_

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace jukebox::backends {

struct CaptureResult {
  int exit_code = -1;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs argv[0] (PATH lookup), feeds stdin_data, collects stdout and stderr.
// The child is killed when `timeout` expires. Throws ResourceUnavailable if
// the binary cannot be executed at all.
CaptureResult RunAndCapture(const std::vector<std::string>& argv,
                            const std::string& stdin_data,
                            std::chrono::milliseconds timeout);

// True if `name` resolves to an executable file through PATH (or is one).
bool IsExecutableOnPath(const std::string& name);

// Scoped child process. The process is stopped and reaped on every exit path:
// Stop(), move-assignment over a live handle, or destruction.
class ProcessHandle {
 public:
  static constexpr std::chrono::milliseconds kDefaultGrace{5000};

  ProcessHandle() = default;
  ~ProcessHandle();

  ProcessHandle(ProcessHandle&& other) noexcept;
  ProcessHandle& operator=(ProcessHandle&& other) noexcept;
  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  // stdout and stderr of the child go to /dev/null. Throws
  // ResourceUnavailable if the binary cannot be executed.
  static ProcessHandle Spawn(const std::vector<std::string>& argv);

  bool Valid() const { return pid_ > 0; }
  pid_t Pid() const { return pid_; }

  // std::nullopt while running. Once an exit is observed the handle keeps
  // reporting the same code.
  std::optional<int> Poll();

  void Terminate();
  void ForceKill();

  // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
  void Stop(std::chrono::milliseconds grace = kDefaultGrace);

 private:
  explicit ProcessHandle(pid_t pid) : pid_(pid) {}

  pid_t pid_ = -1;
  std::optional<int> exit_code_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_SUBPROCESS_HPP_
