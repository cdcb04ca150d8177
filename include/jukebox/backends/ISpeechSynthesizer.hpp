// Repository: Jukebox-controller
// Component: Speech Synthesizer Interface
// Purpose: Renders announcement text into an audio artifact on disk.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_I_SPEECH_SYNTHESIZER_HPP_
#define JUKEBOX_BACKENDS_I_SPEECH_SYNTHESIZER_HPP_

#include <string>

namespace jukebox::backends {

class ISpeechSynthesizer {
 public:
  virtual ~ISpeechSynthesizer() = default;

  // Writes the rendered speech to output_path. Throws ResourceUnavailable
  // (no voice model or synthesizer binary) or CommandFailure.
  virtual void Synthesize(const std::string& text, const std::string& output_path) = 0;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_I_SPEECH_SYNTHESIZER_HPP_
