// Repository: Jukebox-controller
// Component: External Player Interface
// Purpose: Spawns and controls the subprocess that renders video and announcement audio.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_PLAYER_LAUNCHER_HPP_
#define JUKEBOX_BACKENDS_I_PLAYER_LAUNCHER_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "jukebox/backends/ISequencerClient.hpp"

namespace jukebox::backends {

// A running player. Destroying the handle stops the process (graceful
// terminate, then forced kill after the grace period) if it is still alive.
class IPlayerProcess {
 public:
  virtual ~IPlayerProcess() = default;

  // std::nullopt while running, otherwise the exit code.
  virtual std::optional<int> Poll() = 0;

  virtual void Terminate() = 0;
  virtual void ForceKill() = 0;

  // Terminate, wait up to `grace`, then ForceKill. Reaps the process.
  virtual void Stop(std::chrono::milliseconds grace) = 0;

  // Out-of-band pause. Returns false when the process cannot be paused in
  // place; the caller then falls back to stopping it.
  virtual bool SetPaused(bool paused) = 0;

  virtual std::optional<SequencerTime> QueryPositionDuration() = 0;
};

class IPlayerLauncher {
 public:
  virtual ~IPlayerLauncher() = default;

  // Throws ResourceUnavailable when the player binary is missing.
  virtual std::unique_ptr<IPlayerProcess> Spawn(const std::string& playable_target) = 0;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_PLAYER_LAUNCHER_HPP_
