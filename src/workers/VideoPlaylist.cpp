// Repository: Jukebox-controller
// Component: Video Playlist
// Purpose: Channel item list with watched-set aware circular selection.
// Copyright (c) 2026 Jukebox

#include "jukebox/workers/VideoPlaylist.hpp"

namespace jukebox::workers {

void VideoPlaylist::Reset(std::vector<backends::VideoItem> items) {
  items_ = std::move(items);
  index_ = 0;
}

const backends::VideoItem* VideoPlaylist::Current() const {
  if (items_.empty()) return nullptr;
  return &items_[index_];
}

void VideoPlaylist::Advance(int delta) {
  if (items_.empty()) return;
  const long n = static_cast<long>(items_.size());
  const long next = ((static_cast<long>(index_) + delta) % n + n) % n;
  index_ = static_cast<size_t>(next);
}

const backends::VideoItem* VideoPlaylist::SelectNextUnwatched(
    const std::set<std::string>& watched, bool* looped) {
  if (looped) *looped = false;
  if (items_.empty()) return nullptr;

  for (size_t i = 0; i < items_.size(); ++i) {
    const size_t idx = (index_ + i) % items_.size();
    if (watched.count(items_[idx].id) == 0) {
      index_ = idx;
      return &items_[idx];
    }
  }

  index_ = 0;
  if (looped) *looped = true;
  return &items_[0];
}

}  // namespace jukebox::workers
