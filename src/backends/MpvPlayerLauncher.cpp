// Repository: Jukebox-controller
// Component: mpv Player Launcher
// Purpose: IPlayerLauncher that runs mpv audio-only with a JSON IPC socket.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/MpvPlayerLauncher.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "jukebox/util/JsonLine.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::backends {

namespace {

constexpr int kIpcTimeoutMs = 500;

}  // namespace

MpvPlayerProcess::MpvPlayerProcess(ProcessHandle process, std::string ipc_path)
    : process_(std::move(process)), ipc_path_(std::move(ipc_path)) {}

MpvPlayerProcess::~MpvPlayerProcess() {
  process_.Stop();
  unlink(ipc_path_.c_str());
}

std::optional<int> MpvPlayerProcess::Poll() { return process_.Poll(); }

void MpvPlayerProcess::Terminate() { process_.Terminate(); }

void MpvPlayerProcess::ForceKill() { process_.ForceKill(); }

void MpvPlayerProcess::Stop(std::chrono::milliseconds grace) {
  process_.Stop(grace);
  unlink(ipc_path_.c_str());
}

bool MpvPlayerProcess::SetPaused(bool paused) {
  if (process_.Poll()) return false;
  const std::string cmd = std::string("{\"command\":[\"set_property\",\"pause\",") +
                          (paused ? "true]" : "false]");
  auto reply = IpcRequest(cmd);
  if (!reply) return false;
  auto error = util::JsonStringField(*reply, "error");
  return error && *error == "success";
}

std::optional<SequencerTime> MpvPlayerProcess::QueryPositionDuration() {
  if (process_.Poll()) return std::nullopt;
  auto position = GetNumberProperty("time-pos");
  auto duration = GetNumberProperty("duration");
  if (!position && !duration) return std::nullopt;
  SequencerTime t;
  t.position_seconds = position;
  t.duration_seconds = duration;
  return t;
}

std::optional<double> MpvPlayerProcess::GetNumberProperty(const std::string& name) {
  auto reply = IpcRequest("{\"command\":[\"get_property\",\"" + util::JsonEscape(name) + "\"]");
  if (!reply) return std::nullopt;
  auto error = util::JsonStringField(*reply, "error");
  if (!error || *error != "success") return std::nullopt;
  return util::JsonNumberField(*reply, "data");
}

std::optional<std::string> MpvPlayerProcess::IpcRequest(const std::string& command_json) {
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return std::nullopt;

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (ipc_path_.size() >= sizeof(addr.sun_path)) {
    close(fd);
    return std::nullopt;
  }
  std::strncpy(addr.sun_path, ipc_path_.c_str(), sizeof(addr.sun_path) - 1);

  struct timeval tv;
  tv.tv_sec = 0;
  tv.tv_usec = kIpcTimeoutMs * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return std::nullopt;
  }

  const int id = ++request_id_;
  const std::string line = command_json + ",\"request_id\":" + std::to_string(id) + "}\n";
  if (send(fd, line.data(), line.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(line.size())) {
    close(fd);
    return std::nullopt;
  }

  // mpv interleaves asynchronous events with replies; keep the line that
  // carries our request_id.
  std::string buffer;
  char buf[1024];
  std::optional<std::string> reply;
  while (!reply) {
    ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    buffer.append(buf, static_cast<size_t>(n));
    size_t nl;
    while ((nl = buffer.find('\n')) != std::string::npos) {
      std::string candidate = buffer.substr(0, nl);
      buffer.erase(0, nl + 1);
      auto rid = util::JsonIntField(candidate, "request_id");
      if (rid && *rid == id) {
        reply = std::move(candidate);
        break;
      }
    }
  }
  close(fd);
  return reply;
}

MpvPlayerLauncher::MpvPlayerLauncher(std::string ipc_dir, std::string tag, std::string binary)
    : ipc_dir_(std::move(ipc_dir)), tag_(std::move(tag)), binary_(std::move(binary)) {}

std::unique_ptr<IPlayerProcess> MpvPlayerLauncher::Spawn(const std::string& playable_target) {
  const uint64_t n = spawn_count_.fetch_add(1, std::memory_order_relaxed);
  const std::string ipc_path = ipc_dir_ + "/jukebox-mpv-" + tag_ + "-" +
                               std::to_string(getpid()) + "-" + std::to_string(n) + ".sock";
  unlink(ipc_path.c_str());

  ProcessHandle process = ProcessHandle::Spawn(
      {binary_, "--no-video", "--really-quiet", "--input-ipc-server=" + ipc_path,
       playable_target});
  util::Logger::Debug("[MpvPlayerLauncher] spawned pid " + std::to_string(process.Pid()) +
                      " for " + playable_target);
  return std::make_unique<MpvPlayerProcess>(std::move(process), ipc_path);
}

}  // namespace jukebox::backends
