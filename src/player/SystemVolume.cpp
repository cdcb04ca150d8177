// Repository: Jukebox-controller
// Component: System Volume
// Purpose: Hardware output volume with a persisted ceiling.
// Copyright (c) 2026 Jukebox

#include "jukebox/player/SystemVolume.hpp"

#include <algorithm>
#include <string>

#include "jukebox/util/Logger.hpp"

namespace jukebox::player {

SystemVolume::SystemVolume(std::unique_ptr<backends::IMixer> mixer,
                           backends::IPersistenceStore& store)
    : mixer_(std::move(mixer)), store_(store) {
  if (auto limit = store_.LoadMaxVolumeLimit()) {
    max_limit_ = std::clamp(*limit, 0, 100);
  }
}

bool SystemVolume::Available() {
  std::lock_guard<std::mutex> lock(mutex_);
  return mixer_->Available();
}

std::optional<int> SystemVolume::GetVolume() {
  std::lock_guard<std::mutex> lock(mutex_);
  return mixer_->GetVolume();
}

bool SystemVolume::SetVolume(int percent) {
  std::lock_guard<std::mutex> lock(mutex_);
  return SetVolumeLocked(percent);
}

bool SystemVolume::VolumeUp(int step) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto current = mixer_->GetVolume();
  if (!current) return false;
  return SetVolumeLocked(*current + step);
}

bool SystemVolume::VolumeDown(int step) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto current = mixer_->GetVolume();
  if (!current) return false;
  return SetVolumeLocked(*current - step);
}

std::optional<bool> SystemVolume::IsMuted() {
  std::lock_guard<std::mutex> lock(mutex_);
  return mixer_->IsMuted();
}

std::optional<bool> SystemVolume::ToggleMute() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto muted = mixer_->IsMuted();
  if (!muted) return std::nullopt;
  if (!mixer_->SetMuted(!*muted)) return std::nullopt;
  util::Logger::Info(std::string("[SystemVolume] ") + (*muted ? "unmuted" : "muted"));
  return !*muted;
}

int SystemVolume::MaxLimit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_limit_;
}

bool SystemVolume::SetMaxLimit(int percent) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_limit_ = std::clamp(percent, 0, 100);
  if (!store_.SaveMaxVolumeLimit(max_limit_)) {
    util::Logger::Warn("[SystemVolume] could not persist max volume limit");
  }
  util::Logger::Info("[SystemVolume] max limit " + std::to_string(max_limit_) + "%");
  auto current = mixer_->GetVolume();
  if (current && *current > max_limit_) {
    return mixer_->SetVolume(max_limit_);
  }
  return true;
}

bool SystemVolume::SetVolumeLocked(int percent) {
  const int level = std::clamp(percent, 0, max_limit_);
  return mixer_->SetVolume(level);
}

}  // namespace jukebox::player
