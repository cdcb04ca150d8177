// Repository: Jukebox-controller
// Component: MPD Protocol
// Purpose: Pure parsing and quoting helpers for the MPD text protocol.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/MpdProtocol.hpp"

#include <cstdlib>

#include "jukebox/backends/BackendErrors.hpp"

namespace jukebox::backends {

const char* ToString(SequencerPhase phase) {
  switch (phase) {
    case SequencerPhase::kPlaying: return "playing";
    case SequencerPhase::kPaused: return "paused";
    case SequencerPhase::kStopped: return "stopped";
  }
  return "unknown";
}

namespace mpd {

namespace {

std::optional<double> ParseSeconds(const std::string& text) {
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str()) return std::nullopt;
  return v;
}

}  // namespace

bool ParseFieldLine(const std::string& line, std::string* key, std::string* value) {
  size_t sep = line.find(": ");
  if (sep == std::string::npos || sep == 0) return false;
  *key = line.substr(0, sep);
  *value = line.substr(sep + 2);
  return true;
}

bool IsTerminator(const std::string& line) {
  if (line == "OK") return true;
  if (line.rfind("ACK ", 0) == 0) {
    throw CommandFailure("mpd: " + line.substr(4));
  }
  return false;
}

std::optional<std::string> ParseGreeting(const std::string& line) {
  static const std::string kPrefix = "OK MPD ";
  if (line.rfind(kPrefix, 0) != 0) return std::nullopt;
  return line.substr(kPrefix.size());
}

std::optional<std::string> FindField(const Fields& fields, const std::string& key) {
  for (const auto& [k, v] : fields) {
    if (k == key) return v;
  }
  return std::nullopt;
}

SequencerPhase ParsePhase(const Fields& status) {
  auto state = FindField(status, "state");
  if (!state) throw CommandFailure("mpd: status without state");
  if (*state == "play") return SequencerPhase::kPlaying;
  if (*state == "pause") return SequencerPhase::kPaused;
  if (*state == "stop") return SequencerPhase::kStopped;
  throw CommandFailure("mpd: unknown state '" + *state + "'");
}

std::optional<int> ParseVolume(const Fields& status) {
  auto volume = FindField(status, "volume");
  if (!volume) return std::nullopt;
  char* end = nullptr;
  long v = std::strtol(volume->c_str(), &end, 10);
  if (end == volume->c_str() || v < 0) return std::nullopt;
  return static_cast<int>(v > 100 ? 100 : v);
}

SequencerTime ParseTime(const Fields& status) {
  SequencerTime out;
  if (auto elapsed = FindField(status, "elapsed")) {
    out.position_seconds = ParseSeconds(*elapsed);
  }
  if (auto duration = FindField(status, "duration")) {
    out.duration_seconds = ParseSeconds(*duration);
  }
  if (!out.position_seconds || !out.duration_seconds) {
    if (auto time = FindField(status, "time")) {
      size_t colon = time->find(':');
      if (colon != std::string::npos) {
        if (!out.position_seconds) out.position_seconds = ParseSeconds(time->substr(0, colon));
        if (!out.duration_seconds) out.duration_seconds = ParseSeconds(time->substr(colon + 1));
      }
    }
  }
  return out;
}

std::optional<state::TrackInfo> ParseCurrentSong(const Fields& song) {
  if (song.empty()) return std::nullopt;
  state::TrackInfo track;
  track.title = FindField(song, "Title").value_or("Unknown");
  track.artist = FindField(song, "Artist").value_or("Unknown Artist");
  track.album = FindField(song, "Album").value_or("");
  track.uri = FindField(song, "file").value_or("");
  return track;
}

std::string QuoteArgument(const std::string& arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '"';
  for (char c : arg) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

}  // namespace mpd
}  // namespace jukebox::backends
