// Repository: Jukebox-controller
// Component: Reconnect Backoff
// Purpose: Connection phase and capped geometric reconnect delay of a worker.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_RECONNECT_BACKOFF_HPP_
#define JUKEBOX_RUNTIME_RECONNECT_BACKOFF_HPP_

#include <chrono>

namespace jukebox::runtime {

enum class ConnectionPhase {
  kDisconnected,
  kConnecting,
  kConnected,
};

const char* ToString(ConnectionPhase phase);

// ReconnectBackoff is owned by one worker and only touched by its thread.
//
// While disconnected each failed attempt yields the current delay to sleep,
// after which the delay becomes min(delay * factor, max). A successful
// connection resets the delay to base immediately.
class ReconnectBackoff {
 public:
  static constexpr double kDefaultBaseDelaySeconds = 5.0;
  static constexpr double kDefaultMaxDelaySeconds = 60.0;
  static constexpr double kDefaultFactor = 1.5;

  ReconnectBackoff(double base_delay_seconds = kDefaultBaseDelaySeconds,
                   double max_delay_seconds = kDefaultMaxDelaySeconds,
                   double factor = kDefaultFactor);

  ConnectionPhase Phase() const { return phase_; }
  bool IsConnected() const { return phase_ == ConnectionPhase::kConnected; }
  double CurrentDelaySeconds() const { return delay_seconds_; }
  double BaseDelaySeconds() const { return base_delay_seconds_; }
  double MaxDelaySeconds() const { return max_delay_seconds_; }

  void BeginAttempt();
  void OnConnected();

  // Returns the delay to sleep before the next attempt and grows the delay.
  double OnAttemptFailed();

  // Connected -> Disconnected after an operation failure. The delay is not
  // touched; it is already at base after the last successful connect.
  void OnConnectionLost();

  static std::chrono::milliseconds ToDuration(double seconds);

 private:
  const double base_delay_seconds_;
  const double max_delay_seconds_;
  const double factor_;

  ConnectionPhase phase_ = ConnectionPhase::kDisconnected;
  double delay_seconds_;
};

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_RECONNECT_BACKOFF_HPP_
