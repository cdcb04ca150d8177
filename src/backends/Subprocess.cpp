// Repository: Jukebox-controller
// Component: Subprocess
// Purpose: fork/exec helpers for the external CLI tools and players.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/Subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include "jukebox/backends/BackendErrors.hpp"

namespace jukebox::backends {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(20);

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::vector<char*> MakeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
  out.push_back(nullptr);
  return out;
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

// The exec-status pipe is close-on-exec: the parent reads EOF when exec
// succeeded, or the child's errno when it failed.
void ThrowIfExecFailed(int status_fd, const std::string& binary) {
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(status_fd);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    throw ResourceUnavailable("cannot execute " + binary + ": " +
                              std::strerror(child_errno));
  }
}

// Runs in the forked child: only async-signal-safe calls, no allocation.
// `args` is built by MakeArgv in the parent before fork().
[[noreturn]] void ExecChild(char* const* args, int status_fd) {
  execvp(args[0], args);
  int e = errno;
  ssize_t ignored = write(status_fd, &e, sizeof(e));
  (void)ignored;
  _exit(127);
}

}  // namespace

bool IsExecutableOnPath(const std::string& name) {
  if (name.empty()) return false;
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }
  const char* path = std::getenv("PATH");
  if (path == nullptr) return false;
  std::string dirs(path);
  size_t start = 0;
  while (start <= dirs.size()) {
    size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    struct stat st;
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

CaptureResult RunAndCapture(const std::vector<std::string>& argv,
                            const std::string& stdin_data,
                            std::chrono::milliseconds timeout) {
  if (argv.empty()) throw CommandFailure("RunAndCapture: empty argv");
  std::vector<char*> args = MakeArgv(argv);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  // Close-on-exec; dup2 clears the flag on the child's stdio copies.
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
      pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(status_pipe, O_CLOEXEC) != 0) {
    int e = errno;
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(status_pipe);
    throw CommandFailure(std::string("pipe() failed: ") + std::strerror(e));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int e = errno;
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(status_pipe);
    throw CommandFailure(std::string("fork() failed: ") + std::strerror(e));
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    close(status_pipe[0]);
    ExecChild(args.data(), status_pipe[1]);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(status_pipe[1]);

  try {
    ThrowIfExecFailed(status_pipe[0], argv[0]);
  } catch (const ResourceUnavailable&) {
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(err_pipe[0]);
    waitpid(pid, nullptr, 0);
    throw;
  }

  CaptureResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  int in_fd = in_pipe[1];
  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  size_t written = 0;
  if (stdin_data.empty()) {
    close(in_fd);
    in_fd = -1;
  } else {
    fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
  }

  char buf[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }

    struct pollfd fds[3];
    nfds_t n = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;
    if (out_fd >= 0) { fds[n] = {out_fd, POLLIN, 0}; out_idx = static_cast<int>(n++); }
    if (err_fd >= 0) { fds[n] = {err_fd, POLLIN, 0}; err_idx = static_cast<int>(n++); }
    if (in_fd >= 0) { fds[n] = {in_fd, POLLOUT, 0}; in_idx = static_cast<int>(n++); }

    int rc = poll(fds, n, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }

    if (in_idx >= 0 && fds[in_idx].revents != 0) {
      if (fds[in_idx].revents & POLLOUT) {
        ssize_t w = write(in_fd, stdin_data.data() + written, stdin_data.size() - written);
        if (w > 0) written += static_cast<size_t>(w);
        if (w < 0 && errno != EAGAIN && errno != EINTR) written = stdin_data.size();
      } else {
        written = stdin_data.size();
      }
      if (written >= stdin_data.size()) {
        close(in_fd);
        in_fd = -1;
      }
    }
    if (out_idx >= 0 && fds[out_idx].revents != 0) {
      ssize_t r = read(out_fd, buf, sizeof(buf));
      if (r > 0) {
        result.stdout_text.append(buf, static_cast<size_t>(r));
      } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
        close(out_fd);
        out_fd = -1;
      }
    }
    if (err_idx >= 0 && fds[err_idx].revents != 0) {
      ssize_t r = read(err_fd, buf, sizeof(buf));
      if (r > 0) {
        result.stderr_text.append(buf, static_cast<size_t>(r));
      } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
        close(err_fd);
        err_fd = -1;
      }
    }
  }

  if (in_fd >= 0) close(in_fd);
  if (out_fd >= 0) close(out_fd);
  if (err_fd >= 0) close(err_fd);

  int status = 0;
  if (result.timed_out) {
    kill(pid, SIGKILL);
  }
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  result.exit_code = DecodeWaitStatus(status);
  return result;
}

ProcessHandle::~ProcessHandle() {
  Stop();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
  other.pid_ = -1;
  other.exit_code_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
  if (this != &other) {
    Stop();
    pid_ = other.pid_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.exit_code_.reset();
  }
  return *this;
}

ProcessHandle ProcessHandle::Spawn(const std::vector<std::string>& argv) {
  if (argv.empty()) throw CommandFailure("Spawn: empty argv");
  std::vector<char*> args = MakeArgv(argv);

  int status_pipe[2] = {-1, -1};
  if (pipe2(status_pipe, O_CLOEXEC) != 0) {
    throw CommandFailure(std::string("pipe() failed: ") + std::strerror(errno));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int e = errno;
    ClosePipe(status_pipe);
    throw CommandFailure(std::string("fork() failed: ") + std::strerror(e));
  }

  if (pid == 0) {
    close(status_pipe[0]);
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
      dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) close(devnull);
    }
    ExecChild(args.data(), status_pipe[1]);
  }

  close(status_pipe[1]);
  try {
    ThrowIfExecFailed(status_pipe[0], argv[0]);
  } catch (const ResourceUnavailable&) {
    waitpid(pid, nullptr, 0);
    throw;
  }
  return ProcessHandle(pid);
}

std::optional<int> ProcessHandle::Poll() {
  if (exit_code_) return exit_code_;
  if (pid_ <= 0) return std::nullopt;
  int status = 0;
  pid_t r = waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    exit_code_ = DecodeWaitStatus(status);
  } else if (r < 0 && errno == ECHILD) {
    exit_code_ = -1;
  }
  return exit_code_;
}

void ProcessHandle::Terminate() {
  if (pid_ > 0 && !exit_code_) kill(pid_, SIGTERM);
}

void ProcessHandle::ForceKill() {
  if (pid_ > 0 && !exit_code_) kill(pid_, SIGKILL);
}

void ProcessHandle::Stop(std::chrono::milliseconds grace) {
  if (pid_ <= 0) return;
  if (!Poll()) {
    Terminate();
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!Poll() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(kReapPollInterval);
    }
    if (!Poll()) {
      ForceKill();
      int status = 0;
      while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
      exit_code_ = DecodeWaitStatus(status);
    }
  }
  pid_ = -1;
}

}  // namespace jukebox::backends
