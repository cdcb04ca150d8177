// Repository: Jukebox-controller
// Component: File State Store
// Purpose: IPersistenceStore over JSONL files in the data directory.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/FileStateStore.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "jukebox/util/JsonLine.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::backends {

namespace {

bool WriteFileAtomically(const std::string& path, const std::string& contents) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << contents;
    out.flush();
    if (!out) return false;
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

}  // namespace

std::vector<sources::MediaSource> DefaultSources() {
  sources::MediaSource playlist;
  playlist.kind = sources::MediaSourceKind::kSequencerPlaylist;
  playlist.display_name = "My Favorite Playlist";
  playlist.locator = "spotify:playlist:37i9dQZF1DXcBWIGoYBM5M";
  playlist.category = sources::SourceCategory::kMusic;

  sources::MediaSource channel;
  channel.kind = sources::MediaSourceKind::kVideoChannel;
  channel.display_name = "Lofi Hip Hop";
  channel.locator = "https://www.youtube.com/@LofiGirl";
  channel.category = sources::SourceCategory::kMusic;

  return {playlist, channel};
}

FileStateStore::FileStateStore(std::string data_dir) : data_dir_(std::move(data_dir)) {
  if (mkdir(data_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
    util::Logger::Warn("[FileStateStore] cannot create " + data_dir_ + ": " +
                       std::strerror(errno) + " (using in-memory defaults)");
  }
}

std::string FileStateStore::PathOf(const char* file) const {
  return data_dir_ + "/" + file;
}

std::vector<sources::MediaSource> FileStateStore::LoadSources() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(PathOf(kSourcesFile));
  if (!in) {
    util::Logger::Info("[FileStateStore] no " + std::string(kSourcesFile) +
                       ", using default sources");
    return DefaultSources();
  }

  std::vector<sources::MediaSource> out;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    auto kind = util::JsonStringField(line, "kind");
    auto name = util::JsonStringField(line, "name");
    auto locator = util::JsonStringField(line, "locator");
    auto category = util::JsonStringField(line, "category");
    auto parsed_kind = kind ? sources::ParseMediaSourceKind(*kind) : std::nullopt;
    if (!parsed_kind || !name || !locator) {
      util::Logger::Warn("[FileStateStore] skipping invalid source at line " +
                         std::to_string(line_no));
      continue;
    }
    sources::MediaSource source;
    source.kind = *parsed_kind;
    source.display_name = *name;
    source.locator = *locator;
    source.category = category ? sources::ParseSourceCategory(*category)
                                     .value_or(sources::SourceCategory::kMusic)
                               : sources::SourceCategory::kMusic;
    out.push_back(std::move(source));
  }

  if (out.empty()) {
    util::Logger::Warn("[FileStateStore] " + std::string(kSourcesFile) +
                       " has no valid sources, using defaults");
    return DefaultSources();
  }
  return out;
}

bool FileStateStore::SaveSources(const std::vector<sources::MediaSource>& list) {
  std::string contents;
  for (const auto& s : list) {
    contents += util::JsonLineWriter()
                    .Add("kind", sources::ToString(s.kind))
                    .Add("name", s.display_name)
                    .Add("locator", s.locator)
                    .Add("category", sources::ToString(s.category))
                    .Build();
    contents += '\n';
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return WriteFileAtomically(PathOf(kSourcesFile), contents);
}

int FileStateStore::LoadCurrentIndex() {
  auto v = GetAppValue(kCurrentIndexKey);
  return v ? static_cast<int>(*v) : 0;
}

bool FileStateStore::SaveCurrentIndex(int index) {
  return SetAppValue(kCurrentIndexKey, index);
}

std::optional<int> FileStateStore::LoadMaxVolumeLimit() {
  auto v = GetAppValue(kMaxVolumeKey);
  if (!v) return std::nullopt;
  return static_cast<int>(*v);
}

bool FileStateStore::SaveMaxVolumeLimit(int limit) {
  return SetAppValue(kMaxVolumeKey, limit);
}

std::set<std::string> FileStateStore::LoadWatchedSet() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> out;
  std::ifstream in(PathOf(kWatchedFile));
  if (!in) return out;
  std::string line;
  while (std::getline(in, line)) {
    // A torn trailing line after a crash has no closing quote and is skipped.
    if (auto id = util::JsonStringField(line, "id")) {
      out.insert(*id);
    }
  }
  return out;
}

bool FileStateStore::SaveWatchedIds(const std::vector<std::string>& ids) {
  if (ids.empty()) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream out(PathOf(kWatchedFile), std::ios::app);
  if (!out) return false;
  for (const auto& id : ids) {
    out << util::JsonLineWriter().Add("id", id).Build() << '\n';
  }
  out.flush();
  return static_cast<bool>(out);
}

std::map<std::string, int64_t> FileStateStore::ReadAppStateLocked() const {
  std::map<std::string, int64_t> values;
  std::ifstream in(PathOf(kAppStateFile));
  if (!in) return values;
  std::string line;
  while (std::getline(in, line)) {
    auto key = util::JsonStringField(line, "key");
    auto value = util::JsonIntField(line, "value");
    if (key && value) values[*key] = *value;
  }
  return values;
}

bool FileStateStore::WriteAppStateLocked(const std::map<std::string, int64_t>& values) {
  std::string contents;
  for (const auto& [key, value] : values) {
    contents += util::JsonLineWriter().Add("key", key).Add("value", value).Build();
    contents += '\n';
  }
  return WriteFileAtomically(PathOf(kAppStateFile), contents);
}

bool FileStateStore::SetAppValue(const std::string& key, int64_t value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto values = ReadAppStateLocked();
  values[key] = value;
  return WriteAppStateLocked(values);
}

std::optional<int64_t> FileStateStore::GetAppValue(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto values = ReadAppStateLocked();
  auto it = values.find(key);
  if (it == values.end()) return std::nullopt;
  return it->second;
}

}  // namespace jukebox::backends
