// Repository: Jukebox-controller
// Component: yt-dlp Video Source
// Purpose: IVideoSource backed by the yt-dlp command line tool.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_YT_DLP_VIDEO_SOURCE_HPP_
#define JUKEBOX_BACKENDS_YT_DLP_VIDEO_SOURCE_HPP_

#include <chrono>
#include <string>
#include <vector>

#include "jukebox/backends/IVideoSource.hpp"

namespace jukebox::backends {

class YtDlpVideoSource : public IVideoSource {
 public:
  static constexpr std::chrono::milliseconds kListTimeout{30000};
  static constexpr std::chrono::milliseconds kResolveTimeout{30000};

  explicit YtDlpVideoSource(std::string binary = "yt-dlp");

  std::vector<VideoItem> ListItems(const std::string& locator, int max_count) override;
  std::string ResolvePlayableUrl(const std::string& item_url) override;

  // Parses `--print "%(id)s|%(title)s"` output. Lines without a title get
  // "Unknown"; blank lines are skipped.
  static std::vector<VideoItem> ParseFlatPlaylist(const std::string& output);

  // Collapses an accidental "@@handle" into "@handle".
  static std::string NormalizeChannelUrl(const std::string& url);

  static std::string WatchUrl(const std::string& video_id);

 private:
  const std::string binary_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_YT_DLP_VIDEO_SOURCE_HPP_
