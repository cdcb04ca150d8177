// Repository: Jukebox-controller
// Component: Daemon Configuration
// Purpose: Command line and environment configuration for jukebox_controller.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_CONFIG_JUKEBOX_CONFIG_HPP_
#define JUKEBOX_CONFIG_JUKEBOX_CONFIG_HPP_

#include <functional>
#include <optional>
#include <set>
#include <string>

namespace jukebox::config {

struct JukeboxConfig {
  std::string listen_address = "0.0.0.0:50061";
  std::string mpd_host = "localhost";
  int mpd_port = 6600;
  std::string data_dir = "/var/lib/jukebox";
  // Empty means <data_dir>/announcements.
  std::string cache_dir;
  // Empty disables announcements.
  std::string voice_model;
  std::string mixer_control = "PCM";
  int max_videos = 50;

  bool help = false;
  // Flags given explicitly on the command line; the environment does not
  // override these.
  std::set<std::string> explicit_flags;

  std::string EffectiveCacheDir() const;
};

// Returns an error message, or std::nullopt on success.
std::optional<std::string> ParseCommandLine(int argc, const char* const argv[],
                                            JukeboxConfig& config);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads JUKEBOX_* variables through `lookup` (std::getenv by default).
// Returns an error message for malformed values.
std::optional<std::string> ApplyEnvironment(JukeboxConfig& config,
                                            const EnvLookup& lookup = nullptr);

void PrintUsage(const char* program_name);

}  // namespace jukebox::config

#endif  // JUKEBOX_CONFIG_JUKEBOX_CONFIG_HPP_
