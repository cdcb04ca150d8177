// Repository: Jukebox-controller
// Component: Shared Playback State
// Purpose: The single lock-protected PlaybackState read by the API and written by workers.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_STATE_SHARED_PLAYBACK_STATE_HPP_
#define JUKEBOX_STATE_SHARED_PLAYBACK_STATE_HPP_

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "jukebox/state/PlaybackState.hpp"

namespace jukebox::state {

// SharedPlaybackState owns the one PlaybackState instance of the process.
// Readers always receive a copy; writers go through Mutate() so that every
// read-modify-write happens under the same lock. Nothing holds a live
// reference to the inner state outside this class.
class SharedPlaybackState {
 public:
  SharedPlaybackState() = default;

  SharedPlaybackState(const SharedPlaybackState&) = delete;
  SharedPlaybackState& operator=(const SharedPlaybackState&) = delete;

  PlaybackState GetSnapshot() const;

  // Applies fn to the state under the lock. fn must not call back into this
  // object.
  void Mutate(const std::function<void(PlaybackState&)>& fn);

  // Appends a button event stamped with the current wall clock and evicts the
  // oldest entries beyond kEventLogCapacity.
  void AddEvent(int pin_id, ButtonPhase phase, std::optional<std::string> action);

  // Newest first, at most `limit` entries.
  std::vector<ButtonEvent> RecentEvents(size_t limit) const;

  SourceKind ActiveSourceKind() const;

 private:
  mutable std::mutex mutex_;
  PlaybackState state_;
};

}  // namespace jukebox::state

#endif  // JUKEBOX_STATE_SHARED_PLAYBACK_STATE_HPP_
