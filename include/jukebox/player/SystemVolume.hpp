// Repository: Jukebox-controller
// Component: System Volume
// Purpose: Hardware output volume with a persisted ceiling.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_PLAYER_SYSTEM_VOLUME_HPP_
#define JUKEBOX_PLAYER_SYSTEM_VOLUME_HPP_

#include <memory>
#include <mutex>
#include <optional>

#include "jukebox/backends/IMixer.hpp"
#include "jukebox/backends/IPersistenceStore.hpp"

namespace jukebox::player {

// Owned by PlayerService. Every level passed to the mixer is clamped to
// [0, MaxLimit()].
class SystemVolume {
 public:
  static constexpr int kDefaultStep = 5;
  static constexpr int kDefaultMaxLimit = 100;

  SystemVolume(std::unique_ptr<backends::IMixer> mixer, backends::IPersistenceStore& store);

  SystemVolume(const SystemVolume&) = delete;
  SystemVolume& operator=(const SystemVolume&) = delete;

  bool Available();

  std::optional<int> GetVolume();
  bool SetVolume(int percent);
  bool VolumeUp(int step = kDefaultStep);
  bool VolumeDown(int step = kDefaultStep);

  std::optional<bool> IsMuted();
  // Returns the new mute state, std::nullopt if the mixer did not respond.
  std::optional<bool> ToggleMute();

  int MaxLimit() const;
  // Clamped to 0..100 and persisted. A current volume above the new limit is
  // lowered to it.
  bool SetMaxLimit(int percent);

 private:
  bool SetVolumeLocked(int percent);

  std::unique_ptr<backends::IMixer> mixer_;
  backends::IPersistenceStore& store_;

  mutable std::mutex mutex_;
  int max_limit_ = kDefaultMaxLimit;
};

}  // namespace jukebox::player

#endif  // JUKEBOX_PLAYER_SYSTEM_VOLUME_HPP_
