// Repository: Jukebox-controller
// Component: Shared Playback State
// Purpose: The single lock-protected PlaybackState read by the API and written by workers.
// Copyright (c) 2026 Jukebox

#include "jukebox/state/SharedPlaybackState.hpp"

#include <algorithm>

namespace jukebox::state {

const char* ToString(SourceKind kind) {
  switch (kind) {
    case SourceKind::kNone: return "none";
    case SourceKind::kSequencer: return "sequencer";
    case SourceKind::kVideo: return "video";
  }
  return "unknown";
}

const char* ToString(ButtonPhase phase) {
  switch (phase) {
    case ButtonPhase::kPressed: return "pressed";
    case ButtonPhase::kReleased: return "released";
  }
  return "unknown";
}

PlaybackState SharedPlaybackState::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void SharedPlaybackState::Mutate(const std::function<void(PlaybackState&)>& fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  fn(state_);
  while (state_.event_log.size() > PlaybackState::kEventLogCapacity) {
    state_.event_log.pop_front();
  }
}

void SharedPlaybackState::AddEvent(int pin_id, ButtonPhase phase,
                                   std::optional<std::string> action) {
  ButtonEvent event;
  event.pin_id = pin_id;
  event.phase = phase;
  event.action = std::move(action);
  event.timestamp = std::chrono::system_clock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  state_.event_log.push_back(std::move(event));
  while (state_.event_log.size() > PlaybackState::kEventLogCapacity) {
    state_.event_log.pop_front();
  }
}

std::vector<ButtonEvent> SharedPlaybackState::RecentEvents(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ButtonEvent> out;
  out.reserve(std::min(limit, state_.event_log.size()));
  for (auto it = state_.event_log.rbegin();
       it != state_.event_log.rend() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

SourceKind SharedPlaybackState::ActiveSourceKind() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.active_source_kind;
}

}  // namespace jukebox::state
