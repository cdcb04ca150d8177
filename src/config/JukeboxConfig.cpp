// Repository: Jukebox-controller
// Component: Daemon Configuration
// Purpose: Command line and environment configuration for jukebox_controller.
// Copyright (c) 2026 Jukebox

#include "jukebox/config/JukeboxConfig.hpp"

#include <cstdlib>
#include <iostream>

namespace jukebox::config {

namespace {

bool ParsePositiveInt(const std::string& text, int max, int& out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  if (text.size() > 9) return false;
  const int value = std::atoi(text.c_str());
  if (value <= 0 || value > max) return false;
  out = value;
  return true;
}

std::optional<std::string> SystemLookup(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') return std::nullopt;
  return std::string(value);
}

}  // namespace

std::string JukeboxConfig::EffectiveCacheDir() const {
  if (!cache_dir.empty()) return cache_dir;
  return data_dir + "/announcements";
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Jukebox playback controller daemon.\n"
            << "\n"
            << "  --listen ADDR          gRPC listen address (default: 0.0.0.0:50061)\n"
            << "  --mpd-host HOST        MPD host (default: localhost)\n"
            << "  --mpd-port N           MPD port (default: 6600)\n"
            << "  --data-dir DIR         State directory (default: /var/lib/jukebox)\n"
            << "  --cache-dir DIR        Announcement cache (default: <data-dir>/announcements)\n"
            << "  --voice-model PATH     Piper voice model; announcements are disabled without it\n"
            << "  --mixer-control NAME   ALSA mixer control (default: PCM)\n"
            << "  --max-videos N         Items fetched per video channel (default: 50)\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "Environment overrides (when the flag is not given):\n"
            << "  JUKEBOX_LISTEN, JUKEBOX_MPD_HOST, JUKEBOX_MPD_PORT, JUKEBOX_DATA_DIR,\n"
            << "  JUKEBOX_CACHE_DIR, JUKEBOX_VOICE_MODEL, JUKEBOX_MIXER_CONTROL\n"
            << "  JUKEBOX_DEBUG enables debug logging.\n";
}

std::optional<std::string> ParseCommandLine(int argc, const char* const argv[],
                                            JukeboxConfig& config) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.help = true;
      return std::nullopt;
    }

    if (i + 1 >= argc) {
      if (arg.rfind("--", 0) == 0) return "Missing value for " + arg;
      return "Unknown argument: " + arg;
    }
    const std::string value = argv[i + 1];

    if (arg == "--listen") {
      config.listen_address = value;
    } else if (arg == "--mpd-host") {
      config.mpd_host = value;
    } else if (arg == "--mpd-port") {
      if (!ParsePositiveInt(value, 65535, config.mpd_port)) {
        return "Invalid --mpd-port: " + value;
      }
    } else if (arg == "--data-dir") {
      config.data_dir = value;
    } else if (arg == "--cache-dir") {
      config.cache_dir = value;
    } else if (arg == "--voice-model") {
      config.voice_model = value;
    } else if (arg == "--mixer-control") {
      config.mixer_control = value;
    } else if (arg == "--max-videos") {
      if (!ParsePositiveInt(value, 10000, config.max_videos)) {
        return "Invalid --max-videos: " + value;
      }
    } else {
      return "Unknown argument: " + arg;
    }
    config.explicit_flags.insert(arg);
    ++i;
  }
  return std::nullopt;
}

std::optional<std::string> ApplyEnvironment(JukeboxConfig& config, const EnvLookup& lookup) {
  const EnvLookup& get = lookup ? lookup : EnvLookup(SystemLookup);

  auto apply_string = [&](const char* flag, const char* env, std::string& field) {
    if (config.explicit_flags.count(flag) != 0) return;
    if (auto value = get(env)) field = *value;
  };

  apply_string("--listen", "JUKEBOX_LISTEN", config.listen_address);
  apply_string("--mpd-host", "JUKEBOX_MPD_HOST", config.mpd_host);
  apply_string("--data-dir", "JUKEBOX_DATA_DIR", config.data_dir);
  apply_string("--cache-dir", "JUKEBOX_CACHE_DIR", config.cache_dir);
  apply_string("--voice-model", "JUKEBOX_VOICE_MODEL", config.voice_model);
  apply_string("--mixer-control", "JUKEBOX_MIXER_CONTROL", config.mixer_control);

  if (config.explicit_flags.count("--mpd-port") == 0) {
    if (auto value = get("JUKEBOX_MPD_PORT")) {
      if (!ParsePositiveInt(*value, 65535, config.mpd_port)) {
        return "Invalid JUKEBOX_MPD_PORT: " + *value;
      }
    }
  }
  return std::nullopt;
}

}  // namespace jukebox::config
