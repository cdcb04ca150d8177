// Repository: Jukebox-controller
// Component: Announcement Cache
// Purpose: Content-addressed store of synthesized speech keyed by SHA-256 of the text.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_MEDIA_ANNOUNCEMENT_CACHE_HPP_
#define JUKEBOX_MEDIA_ANNOUNCEMENT_CACHE_HPP_

#include <string>

namespace jukebox::media {

// <cache_dir>/<sha256 hex of text>.wav
class AnnouncementCache {
 public:
  explicit AnnouncementCache(std::string cache_dir);

  // Lowercase hex SHA-256 of the exact bytes of `text`.
  static std::string KeyFor(const std::string& text);

  std::string PathFor(const std::string& text) const;

  // True if a non-empty artifact exists for `text`.
  bool Contains(const std::string& text) const;

  // Removes the artifact for `text`, if any.
  void Evict(const std::string& text) const;

  const std::string& Directory() const { return cache_dir_; }

 private:
  const std::string cache_dir_;
};

}  // namespace jukebox::media

#endif  // JUKEBOX_MEDIA_ANNOUNCEMENT_CACHE_HPP_
