// Repository: Jukebox-controller
// Component: Reconnect Backoff
// Purpose: Connection phase and capped geometric reconnect delay of a worker.
// Copyright (c) 2026 Jukebox

#include "jukebox/runtime/ReconnectBackoff.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace jukebox::runtime {

const char* ToString(ConnectionPhase phase) {
  switch (phase) {
    case ConnectionPhase::kDisconnected: return "disconnected";
    case ConnectionPhase::kConnecting: return "connecting";
    case ConnectionPhase::kConnected: return "connected";
  }
  return "unknown";
}

ReconnectBackoff::ReconnectBackoff(double base_delay_seconds,
                                   double max_delay_seconds,
                                   double factor)
    : base_delay_seconds_(std::max(0.0, base_delay_seconds)),
      max_delay_seconds_(std::max(base_delay_seconds_, max_delay_seconds)),
      factor_(std::max(1.0, factor)),
      delay_seconds_(base_delay_seconds_) {}

void ReconnectBackoff::BeginAttempt() {
  phase_ = ConnectionPhase::kConnecting;
}

void ReconnectBackoff::OnConnected() {
  phase_ = ConnectionPhase::kConnected;
  delay_seconds_ = base_delay_seconds_;
}

double ReconnectBackoff::OnAttemptFailed() {
  phase_ = ConnectionPhase::kDisconnected;
  const double sleep_for = delay_seconds_;
  delay_seconds_ = std::min(delay_seconds_ * factor_, max_delay_seconds_);
  return sleep_for;
}

void ReconnectBackoff::OnConnectionLost() {
  phase_ = ConnectionPhase::kDisconnected;
}

std::chrono::milliseconds ReconnectBackoff::ToDuration(double seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

}  // namespace jukebox::runtime
