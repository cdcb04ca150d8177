// Repository: Jukebox-controller
// Component: yt-dlp Video Source
// Purpose: IVideoSource backed by the yt-dlp command line tool.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/YtDlpVideoSource.hpp"

#include <sstream>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/backends/Subprocess.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::backends {

namespace {

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string FirstLine(const std::string& s) {
  std::istringstream in(s);
  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (!line.empty()) return line;
  }
  return "";
}

}  // namespace

YtDlpVideoSource::YtDlpVideoSource(std::string binary) : binary_(std::move(binary)) {}

std::vector<VideoItem> YtDlpVideoSource::ListItems(const std::string& locator, int max_count) {
  const std::string url = NormalizeChannelUrl(locator);
  util::Logger::Debug("[YtDlpVideoSource] listing " + url);

  CaptureResult r = RunAndCapture(
      {binary_, "--flat-playlist", "--print", "%(id)s|%(title)s",
       "--playlist-end", std::to_string(max_count), url},
      "", kListTimeout);
  if (r.timed_out) {
    throw CommandFailure("yt-dlp timed out listing " + url);
  }
  if (r.exit_code != 0) {
    throw CommandFailure("yt-dlp failed listing " + url + ": " + Trim(r.stderr_text));
  }

  auto items = ParseFlatPlaylist(r.stdout_text);
  if (max_count > 0 && items.size() > static_cast<size_t>(max_count)) {
    items.resize(static_cast<size_t>(max_count));
  }
  return items;
}

std::string YtDlpVideoSource::ResolvePlayableUrl(const std::string& item_url) {
  CaptureResult r = RunAndCapture({binary_, "-f", "bestaudio/best", "-g", item_url},
                                  "", kResolveTimeout);
  if (r.timed_out) {
    throw CommandFailure("yt-dlp timed out resolving " + item_url);
  }
  if (r.exit_code != 0) {
    throw CommandFailure("yt-dlp cannot resolve " + item_url + ": " + Trim(r.stderr_text));
  }
  std::string playable = FirstLine(r.stdout_text);
  if (playable.empty()) {
    throw CommandFailure("yt-dlp returned no stream for " + item_url);
  }
  return playable;
}

std::vector<VideoItem> YtDlpVideoSource::ParseFlatPlaylist(const std::string& output) {
  std::vector<VideoItem> items;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    if (Trim(line).empty()) continue;
    VideoItem item;
    size_t bar = line.find('|');
    if (bar == std::string::npos) {
      item.id = Trim(line);
      item.title = "Unknown";
    } else {
      item.id = Trim(line.substr(0, bar));
      item.title = Trim(line.substr(bar + 1));
      if (item.title.empty()) item.title = "Unknown";
    }
    if (item.id.empty()) continue;
    item.url = WatchUrl(item.id);
    items.push_back(std::move(item));
  }
  return items;
}

std::string YtDlpVideoSource::NormalizeChannelUrl(const std::string& url) {
  std::string out = url;
  size_t pos;
  while ((pos = out.find("@@")) != std::string::npos) {
    out.erase(pos, 1);
  }
  return out;
}

std::string YtDlpVideoSource::WatchUrl(const std::string& video_id) {
  return "https://www.youtube.com/watch?v=" + video_id;
}

}  // namespace jukebox::backends
