// Repository: Jukebox-controller
// Component: ALSA amixer Mixer
// Purpose: IMixer implemented with the amixer command line tool.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/AmixerMixer.hpp"

#include <algorithm>
#include <cstdlib>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/backends/Subprocess.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::backends {

AmixerMixer::AmixerMixer(std::string control_name, std::string binary)
    : control_name_(std::move(control_name)), binary_(std::move(binary)) {}

bool AmixerMixer::Available() {
  if (!available_) {
    available_ = Query().has_value();
    if (!*available_) {
      util::Logger::Warn("[AmixerMixer] ALSA control '" + control_name_ + "' not available");
    }
  }
  return *available_;
}

std::optional<int> AmixerMixer::GetVolume() {
  if (!Available()) return std::nullopt;
  auto out = Query();
  if (!out) return std::nullopt;
  return ParsePercent(*out);
}

bool AmixerMixer::SetVolume(int percent) {
  if (!Available()) return false;
  percent = std::clamp(percent, 0, 100);
  return Run({binary_, "-M", "sset", control_name_, std::to_string(percent) + "%"});
}

std::optional<bool> AmixerMixer::IsMuted() {
  if (!Available()) return std::nullopt;
  auto out = Query();
  if (!out) return std::nullopt;
  return ParseMuted(*out);
}

bool AmixerMixer::SetMuted(bool muted) {
  if (!Available()) return false;
  return Run({binary_, "sset", control_name_, muted ? "mute" : "unmute"});
}

std::optional<std::string> AmixerMixer::Query() {
  try {
    CaptureResult r = RunAndCapture({binary_, "-M", "sget", control_name_}, "", kCommandTimeout);
    if (r.timed_out || r.exit_code != 0) return std::nullopt;
    return r.stdout_text;
  } catch (const ResourceUnavailable& e) {
    util::Logger::Debug(std::string("[AmixerMixer] ") + e.what());
    return std::nullopt;
  }
}

bool AmixerMixer::Run(const std::vector<std::string>& args) {
  try {
    CaptureResult r = RunAndCapture(args, "", kCommandTimeout);
    if (r.timed_out || r.exit_code != 0) {
      util::Logger::Error("[AmixerMixer] " + args[2] + " failed: " + r.stderr_text);
      return false;
    }
    return true;
  } catch (const std::runtime_error& e) {
    util::Logger::Error(std::string("[AmixerMixer] ") + e.what());
    return false;
  }
}

std::optional<int> AmixerMixer::ParsePercent(const std::string& output) {
  size_t pos = 0;
  while ((pos = output.find('[', pos)) != std::string::npos) {
    size_t end = output.find("%]", pos);
    if (end == std::string::npos) return std::nullopt;
    const std::string digits = output.substr(pos + 1, end - pos - 1);
    if (!digits.empty() &&
        digits.find_first_not_of("0123456789") == std::string::npos) {
      return std::atoi(digits.c_str());
    }
    ++pos;
  }
  return std::nullopt;
}

bool AmixerMixer::ParseMuted(const std::string& output) {
  return output.find("[off]") != std::string::npos;
}

}  // namespace jukebox::backends
