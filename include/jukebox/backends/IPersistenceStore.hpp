// Repository: Jukebox-controller
// Component: Persistence Store Interface
// Purpose: Durable storage for the source list, current index, watched set and settings.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_PERSISTENCE_STORE_HPP_
#define JUKEBOX_BACKENDS_I_PERSISTENCE_STORE_HPP_

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "jukebox/sources/MediaSource.hpp"

namespace jukebox::backends {

// Loads never throw: an unavailable store yields the in-memory defaults
// (DefaultSources(), index 0, empty watched set). Saves return false on
// failure and the caller logs it.
class IPersistenceStore {
 public:
  virtual ~IPersistenceStore() = default;

  virtual std::vector<sources::MediaSource> LoadSources() = 0;
  virtual bool SaveSources(const std::vector<sources::MediaSource>& sources) = 0;

  virtual int LoadCurrentIndex() = 0;
  virtual bool SaveCurrentIndex(int index) = 0;

  virtual std::set<std::string> LoadWatchedSet() = 0;
  virtual bool SaveWatchedIds(const std::vector<std::string>& ids) = 0;

  virtual std::optional<int> LoadMaxVolumeLimit() = 0;
  virtual bool SaveMaxVolumeLimit(int limit) = 0;
};

std::vector<sources::MediaSource> DefaultSources();

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_PERSISTENCE_STORE_HPP_
