// Repository: Jukebox-controller
// Component: Playback State Types
// Purpose: Value types describing what is currently playing and recent button edges.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_STATE_PLAYBACK_STATE_HPP_
#define JUKEBOX_STATE_PLAYBACK_STATE_HPP_

#include <chrono>
#include <deque>
#include <optional>
#include <string>

namespace jukebox::state {

// Which backend currently owns audio output. Never more than one.
enum class SourceKind {
  kNone,
  kSequencer,
  kVideo,
};

const char* ToString(SourceKind kind);

struct TrackInfo {
  std::string title;
  std::string artist;
  std::string album;
  std::string uri;

  bool operator==(const TrackInfo& other) const {
    return title == other.title && artist == other.artist &&
           album == other.album && uri == other.uri;
  }
};

enum class ButtonPhase {
  kPressed,
  kReleased,
};

const char* ToString(ButtonPhase phase);

// One edge on a physical button. Immutable once appended to the log.
struct ButtonEvent {
  int pin_id = 0;
  ButtonPhase phase = ButtonPhase::kPressed;
  std::optional<std::string> action;
  std::chrono::system_clock::time_point timestamp;
};

struct PlaybackState {
  static constexpr size_t kEventLogCapacity = 100;

  bool is_playing = false;
  std::optional<TrackInfo> current_track;
  SourceKind active_source_kind = SourceKind::kNone;
  std::optional<double> position_seconds;
  std::optional<double> duration_seconds;
  // Oldest first.
  std::deque<ButtonEvent> event_log;
};

}  // namespace jukebox::state

#endif  // JUKEBOX_STATE_PLAYBACK_STATE_HPP_
