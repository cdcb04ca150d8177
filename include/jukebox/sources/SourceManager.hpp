// Repository: Jukebox-controller
// Component: Source Manager
// Purpose: Ordered list of media sources with a persisted, debounced current index.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_SOURCES_SOURCE_MANAGER_HPP_
#define JUKEBOX_SOURCES_SOURCE_MANAGER_HPP_

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "jukebox/backends/IPersistenceStore.hpp"
#include "jukebox/sources/DebouncedIndexWriter.hpp"
#include "jukebox/sources/MediaSource.hpp"

namespace jukebox::sources {

// Thrown by Next()/Previous() when there is nothing to rotate through.
class EmptySourceList : public std::runtime_error {
 public:
  EmptySourceList() : std::runtime_error("source list is empty") {}
};

// Invariant: 0 <= current index < size whenever the list is non-empty.
// Rotation persists the index through a DebouncedIndexWriter; list edits
// are written through immediately.
class SourceManager {
 public:
  SourceManager(backends::IPersistenceStore& store,
                std::chrono::milliseconds debounce_window = DebouncedIndexWriter::kDefaultWindow);

  SourceManager(const SourceManager&) = delete;
  SourceManager& operator=(const SourceManager&) = delete;

  std::optional<MediaSource> GetCurrent() const;
  // -1 when the list is empty.
  int CurrentIndex() const;

  MediaSource Next();
  MediaSource Previous();

  std::vector<MediaSource> AllSources() const;
  size_t Size() const;

  void AddSource(MediaSource source);
  // False when index is out of range.
  bool RemoveSource(size_t index);

  // Forces the pending debounced index write, e.g. before shutdown.
  void FlushPendingIndex();

 private:
  MediaSource StepLocked(int delta);
  void PersistSourcesLocked();

  backends::IPersistenceStore& store_;

  mutable std::mutex mutex_;
  std::vector<MediaSource> sources_;
  int current_index_ = 0;

  // Declared last: its thread must stop before the members above go away.
  DebouncedIndexWriter index_writer_;
};

}  // namespace jukebox::sources

#endif  // JUKEBOX_SOURCES_SOURCE_MANAGER_HPP_
