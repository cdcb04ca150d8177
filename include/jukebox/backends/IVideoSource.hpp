// Repository: Jukebox-controller
// Component: Video Source Interface
// Purpose: Lists channel items and resolves them to playable stream URLs.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_VIDEO_SOURCE_HPP_
#define JUKEBOX_BACKENDS_I_VIDEO_SOURCE_HPP_

#include <string>
#include <vector>

namespace jukebox::backends {

struct VideoItem {
  std::string id;
  std::string title;
  std::string url;
};

class IVideoSource {
 public:
  virtual ~IVideoSource() = default;

  // Newest first, at most max_count items. Throws CommandFailure or
  // ResourceUnavailable.
  virtual std::vector<VideoItem> ListItems(const std::string& locator, int max_count) = 0;

  // Throws CommandFailure when the item cannot be streamed (yet), e.g. a
  // scheduled premiere.
  virtual std::string ResolvePlayableUrl(const std::string& item_url) = 0;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_VIDEO_SOURCE_HPP_
