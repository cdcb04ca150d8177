// Repository: Jukebox-controller
// Component: Media Source
// Purpose: One entry of the rotating source list.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_SOURCES_MEDIA_SOURCE_HPP_
#define JUKEBOX_SOURCES_MEDIA_SOURCE_HPP_

#include <optional>
#include <string>

namespace jukebox::sources {

enum class MediaSourceKind {
  kSequencerPlaylist,
  kVideoChannel,
};

enum class SourceCategory {
  kMusic,
  kNews,
};

struct MediaSource {
  MediaSourceKind kind = MediaSourceKind::kSequencerPlaylist;
  std::string display_name;
  // Playlist URI for the sequencer, channel URL for video.
  std::string locator;
  SourceCategory category = SourceCategory::kMusic;

  bool operator==(const MediaSource& other) const {
    return kind == other.kind && display_name == other.display_name &&
           locator == other.locator && category == other.category;
  }
};

const char* ToString(MediaSourceKind kind);
const char* ToString(SourceCategory category);

// Inverse of ToString; std::nullopt for unknown names. The legacy names
// "spotify_playlist" and "youtube_channel" are accepted as kinds.
std::optional<MediaSourceKind> ParseMediaSourceKind(const std::string& name);
std::optional<SourceCategory> ParseSourceCategory(const std::string& name);

}  // namespace jukebox::sources

#endif  // JUKEBOX_SOURCES_MEDIA_SOURCE_HPP_
