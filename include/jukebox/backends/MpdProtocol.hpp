// Repository: Jukebox-controller
// Component: MPD Protocol
// Purpose: Pure parsing and quoting helpers for the MPD text protocol.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_MPD_PROTOCOL_HPP_
#define JUKEBOX_BACKENDS_MPD_PROTOCOL_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "jukebox/backends/ISequencerClient.hpp"
#include "jukebox/state/PlaybackState.hpp"

namespace jukebox::backends::mpd {

// Key/value pairs of one response, in wire order, without the final "OK".
using Fields = std::vector<std::pair<std::string, std::string>>;

// Splits "key: value". Returns false for lines without ": ".
bool ParseFieldLine(const std::string& line, std::string* key, std::string* value);

// True for the "OK" terminator, false for field lines. Throws CommandFailure
// for an "ACK [...]" line.
bool IsTerminator(const std::string& line);

// "OK MPD <version>" greeting. Returns the version, or std::nullopt.
std::optional<std::string> ParseGreeting(const std::string& line);

std::optional<std::string> FindField(const Fields& fields, const std::string& key);

// From `status`. Throws CommandFailure if "state" is missing or unknown.
SequencerPhase ParsePhase(const Fields& status);

// From `status`. std::nullopt when the mixer is disabled (volume -1 or absent).
std::optional<int> ParseVolume(const Fields& status);

// From `status`: "elapsed"/"duration", falling back to "time: a:b".
SequencerTime ParseTime(const Fields& status);

// From `currentsong`. std::nullopt for an empty response. Missing tags
// default to "Unknown" / "Unknown Artist" / "".
std::optional<state::TrackInfo> ParseCurrentSong(const Fields& song);

// Double-quotes an argument, escaping '"' and '\'.
std::string QuoteArgument(const std::string& arg);

}  // namespace jukebox::backends::mpd

#endif  // JUKEBOX_BACKENDS_MPD_PROTOCOL_HPP_
