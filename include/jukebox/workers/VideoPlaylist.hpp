// Repository: Jukebox-controller
// Component: Video Playlist
// Purpose: Channel item list with watched-set aware circular selection.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_WORKERS_VIDEO_PLAYLIST_HPP_
#define JUKEBOX_WORKERS_VIDEO_PLAYLIST_HPP_

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "jukebox/backends/IVideoSource.hpp"

namespace jukebox::workers {

class VideoPlaylist {
 public:
  void Reset(std::vector<backends::VideoItem> items);

  bool Empty() const { return items_.empty(); }
  size_t Size() const { return items_.size(); }
  size_t Index() const { return index_; }
  const std::vector<backends::VideoItem>& Items() const { return items_; }

  // nullptr when empty.
  const backends::VideoItem* Current() const;

  // Moves the index by delta, wrapping in both directions.
  void Advance(int delta);

  // Scans forward from the current index, wrapping, for the first item whose
  // id is not in `watched`, and moves the index there. When every item is
  // watched the index resets to 0 and the first item is returned; *looped is
  // then set. nullptr when empty.
  const backends::VideoItem* SelectNextUnwatched(const std::set<std::string>& watched,
                                                 bool* looped = nullptr);

 private:
  std::vector<backends::VideoItem> items_;
  size_t index_ = 0;
};

}  // namespace jukebox::workers

#endif  // JUKEBOX_WORKERS_VIDEO_PLAYLIST_HPP_
