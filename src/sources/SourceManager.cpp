// Repository: Jukebox-controller
// Component: Source Manager
// Purpose: Ordered list of media sources with a persisted, debounced current index.
// Copyright (c) 2026 Jukebox

#include "jukebox/sources/SourceManager.hpp"

#include "jukebox/util/Logger.hpp"

namespace jukebox::sources {

SourceManager::SourceManager(backends::IPersistenceStore& store,
                             std::chrono::milliseconds debounce_window)
    : store_(store),
      sources_(store.LoadSources()),
      current_index_(store.LoadCurrentIndex()),
      index_writer_([this](int index) { return store_.SaveCurrentIndex(index); },
                    debounce_window) {
  if (current_index_ < 0 || current_index_ >= static_cast<int>(sources_.size())) {
    if (!sources_.empty()) {
      util::Logger::Warn("[SourceManager] saved index " + std::to_string(current_index_) +
                         " out of range, resetting to 0");
    }
    current_index_ = 0;
  }
  util::Logger::Info("[SourceManager] " + std::to_string(sources_.size()) +
                     " sources, current index " + std::to_string(current_index_));
}

std::optional<MediaSource> SourceManager::GetCurrent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sources_.empty()) return std::nullopt;
  return sources_[static_cast<size_t>(current_index_)];
}

int SourceManager::CurrentIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.empty() ? -1 : current_index_;
}

MediaSource SourceManager::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  return StepLocked(1);
}

MediaSource SourceManager::Previous() {
  std::lock_guard<std::mutex> lock(mutex_);
  return StepLocked(-1);
}

MediaSource SourceManager::StepLocked(int delta) {
  if (sources_.empty()) throw EmptySourceList();
  const int n = static_cast<int>(sources_.size());
  current_index_ = ((current_index_ + delta) % n + n) % n;
  index_writer_.Schedule(current_index_);
  const MediaSource& source = sources_[static_cast<size_t>(current_index_)];
  util::Logger::Info("[SourceManager] switched to source " + std::to_string(current_index_) +
                     ": " + source.display_name);
  return source;
}

std::vector<MediaSource> SourceManager::AllSources() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_;
}

size_t SourceManager::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.size();
}

void SourceManager::AddSource(MediaSource source) {
  std::lock_guard<std::mutex> lock(mutex_);
  util::Logger::Info("[SourceManager] added source: " + source.display_name);
  sources_.push_back(std::move(source));
  PersistSourcesLocked();
}

bool SourceManager::RemoveSource(size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= sources_.size()) return false;
  const std::string name = sources_[index].display_name;
  sources_.erase(sources_.begin() + static_cast<std::ptrdiff_t>(index));
  if (current_index_ >= static_cast<int>(sources_.size())) {
    current_index_ = 0;
  }
  PersistSourcesLocked();
  index_writer_.Schedule(current_index_);
  util::Logger::Info("[SourceManager] removed source: " + name);
  return true;
}

void SourceManager::FlushPendingIndex() {
  index_writer_.Flush();
}

void SourceManager::PersistSourcesLocked() {
  if (!store_.SaveSources(sources_)) {
    util::Logger::Error("[SourceManager] failed to persist source list");
  }
}

}  // namespace jukebox::sources
