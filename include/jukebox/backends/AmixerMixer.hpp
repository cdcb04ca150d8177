// Repository: Jukebox-controller
// Component: ALSA amixer Mixer
// Purpose: IMixer implemented with the amixer command line tool.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_AMIXER_MIXER_HPP_
#define JUKEBOX_BACKENDS_AMIXER_MIXER_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "jukebox/backends/IMixer.hpp"

namespace jukebox::backends {

class AmixerMixer : public IMixer {
 public:
  static constexpr std::chrono::milliseconds kCommandTimeout{5000};

  explicit AmixerMixer(std::string control_name = "PCM", std::string binary = "amixer");

  bool Available() override;
  std::optional<int> GetVolume() override;
  bool SetVolume(int percent) override;
  std::optional<bool> IsMuted() override;
  bool SetMuted(bool muted) override;

  // First "[NN%]" in `amixer sget` output.
  static std::optional<int> ParsePercent(const std::string& output);
  // True if any channel reports "[off]".
  static bool ParseMuted(const std::string& output);

 private:
  // Output of `amixer -M sget <control>`, or std::nullopt on failure.
  std::optional<std::string> Query();
  bool Run(const std::vector<std::string>& args);

  const std::string control_name_;
  const std::string binary_;
  std::optional<bool> available_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_AMIXER_MIXER_HPP_
