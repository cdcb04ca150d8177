// Repository: Jukebox-controller
// Component: File State Store
// Purpose: IPersistenceStore over JSONL files in the data directory.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_FILE_STATE_STORE_HPP_
#define JUKEBOX_BACKENDS_FILE_STATE_STORE_HPP_

#include <map>
#include <mutex>
#include <string>

#include "jukebox/backends/IPersistenceStore.hpp"

namespace jukebox::backends {

// Files under data_dir:
//   sources.jsonl         {"kind":...,"name":...,"locator":...,"category":...} per line
//   app_state.jsonl       {"key":...,"value":<int>} per line, rewritten on save
//   watched_videos.jsonl  {"id":...} per line, append-only
//
// Rewrites go through a temp file and rename(), so a crash never leaves a
// half-written file. Corrupt lines are skipped with a warning.
class FileStateStore : public IPersistenceStore {
 public:
  static constexpr const char* kSourcesFile = "sources.jsonl";
  static constexpr const char* kAppStateFile = "app_state.jsonl";
  static constexpr const char* kWatchedFile = "watched_videos.jsonl";
  static constexpr const char* kCurrentIndexKey = "current_source_index";
  static constexpr const char* kMaxVolumeKey = "max_volume_limit";

  explicit FileStateStore(std::string data_dir);

  std::vector<sources::MediaSource> LoadSources() override;
  bool SaveSources(const std::vector<sources::MediaSource>& sources) override;

  int LoadCurrentIndex() override;
  bool SaveCurrentIndex(int index) override;

  std::set<std::string> LoadWatchedSet() override;
  bool SaveWatchedIds(const std::vector<std::string>& ids) override;

  std::optional<int> LoadMaxVolumeLimit() override;
  bool SaveMaxVolumeLimit(int limit) override;

  const std::string& DataDir() const { return data_dir_; }

 private:
  std::string PathOf(const char* file) const;
  std::map<std::string, int64_t> ReadAppStateLocked() const;
  bool WriteAppStateLocked(const std::map<std::string, int64_t>& values);
  bool SetAppValue(const std::string& key, int64_t value);
  std::optional<int64_t> GetAppValue(const std::string& key);

  const std::string data_dir_;
  std::mutex mutex_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_FILE_STATE_STORE_HPP_
