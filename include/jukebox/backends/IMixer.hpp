// Repository: Jukebox-controller
// Component: Mixer Interface
// Purpose: System output mixer (hardware volume and mute).
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_MIXER_HPP_
#define JUKEBOX_BACKENDS_I_MIXER_HPP_

#include <optional>

namespace jukebox::backends {

// Percentages are on the perceptual (mapped) 0-100 scale.
class IMixer {
 public:
  virtual ~IMixer() = default;

  virtual bool Available() = 0;
  virtual std::optional<int> GetVolume() = 0;
  virtual bool SetVolume(int percent) = 0;
  virtual std::optional<bool> IsMuted() = 0;
  virtual bool SetMuted(bool muted) = 0;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_MIXER_HPP_
