// Repository: Jukebox-controller
// Component: Media Source
// Purpose: One entry of the rotating source list.
// Copyright (c) 2026 Jukebox

#include "jukebox/sources/MediaSource.hpp"

namespace jukebox::sources {

const char* ToString(MediaSourceKind kind) {
  switch (kind) {
    case MediaSourceKind::kSequencerPlaylist: return "sequencer_playlist";
    case MediaSourceKind::kVideoChannel: return "video_channel";
  }
  return "unknown";
}

const char* ToString(SourceCategory category) {
  switch (category) {
    case SourceCategory::kMusic: return "music";
    case SourceCategory::kNews: return "news";
  }
  return "unknown";
}

std::optional<MediaSourceKind> ParseMediaSourceKind(const std::string& name) {
  if (name == "sequencer_playlist" || name == "spotify_playlist") {
    return MediaSourceKind::kSequencerPlaylist;
  }
  if (name == "video_channel" || name == "youtube_channel") {
    return MediaSourceKind::kVideoChannel;
  }
  return std::nullopt;
}

std::optional<SourceCategory> ParseSourceCategory(const std::string& name) {
  if (name == "music") return SourceCategory::kMusic;
  if (name == "news") return SourceCategory::kNews;
  return std::nullopt;
}

}  // namespace jukebox::sources
