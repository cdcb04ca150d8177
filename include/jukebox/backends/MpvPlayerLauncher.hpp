// Repository: Jukebox-controller
// Component: mpv Player Launcher
// Purpose: IPlayerLauncher that runs mpv audio-only with a JSON IPC socket.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_MPV_PLAYER_LAUNCHER_HPP_
#define JUKEBOX_BACKENDS_MPV_PLAYER_LAUNCHER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "jukebox/backends/IPlayerLauncher.hpp"
#include "jukebox/backends/Subprocess.hpp"

namespace jukebox::backends {

class MpvPlayerProcess : public IPlayerProcess {
 public:
  MpvPlayerProcess(ProcessHandle process, std::string ipc_path);
  ~MpvPlayerProcess() override;

  std::optional<int> Poll() override;
  void Terminate() override;
  void ForceKill() override;
  void Stop(std::chrono::milliseconds grace) override;
  bool SetPaused(bool paused) override;
  std::optional<SequencerTime> QueryPositionDuration() override;

 private:
  // Sends one command line and returns the matching reply line, or
  // std::nullopt when the socket is not reachable.
  std::optional<std::string> IpcRequest(const std::string& command_json);
  std::optional<double> GetNumberProperty(const std::string& name);

  ProcessHandle process_;
  const std::string ipc_path_;
  int request_id_ = 0;
};

class MpvPlayerLauncher : public IPlayerLauncher {
 public:
  // ipc_dir holds one socket per spawned player; tag distinguishes the
  // video and announcement players.
  MpvPlayerLauncher(std::string ipc_dir, std::string tag, std::string binary = "mpv");

  std::unique_ptr<IPlayerProcess> Spawn(const std::string& playable_target) override;

 private:
  const std::string ipc_dir_;
  const std::string tag_;
  const std::string binary_;
  std::atomic<uint64_t> spawn_count_{0};
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_MPV_PLAYER_LAUNCHER_HPP_
