// Repository: Jukebox-controller
// Component: Sequencer Client Interface
// Purpose: Persistent-connection music backend consumed by the Sequencer Worker.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_SEQUENCER_CLIENT_HPP_
#define JUKEBOX_BACKENDS_I_SEQUENCER_CLIENT_HPP_

#include <optional>
#include <string>

#include "jukebox/state/PlaybackState.hpp"

namespace jukebox::backends {

enum class SequencerPhase {
  kPlaying,
  kPaused,
  kStopped,
};

const char* ToString(SequencerPhase phase);

struct SequencerTime {
  std::optional<double> position_seconds;
  std::optional<double> duration_seconds;
};

// Every call may throw ConnectionFailure or CommandFailure.
// Implementations are used from the owning worker thread only.
class ISequencerClient {
 public:
  virtual ~ISequencerClient() = default;

  virtual void Connect(const std::string& host, int port) = 0;
  virtual void Disconnect() = 0;

  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void Next() = 0;
  virtual void Previous() = 0;
  virtual void Stop() = 0;
  virtual void Load(const std::string& locator, bool shuffle, bool autoplay) = 0;

  virtual int GetVolume() = 0;
  virtual void SetVolume(int level) = 0;

  virtual SequencerPhase GetPhase() = 0;
  virtual std::optional<state::TrackInfo> GetCurrentItem() = 0;
  virtual SequencerTime GetTime() = 0;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_SEQUENCER_CLIENT_HPP_
