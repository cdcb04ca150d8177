// Repository: Jukebox-controller
// Component: Piper Synthesizer
// Purpose: ISpeechSynthesizer backed by the piper TTS command line tool.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_PIPER_SYNTHESIZER_HPP_
#define JUKEBOX_BACKENDS_PIPER_SYNTHESIZER_HPP_

#include <chrono>
#include <string>

#include "jukebox/backends/ISpeechSynthesizer.hpp"

namespace jukebox::backends {

class PiperSynthesizer : public ISpeechSynthesizer {
 public:
  static constexpr std::chrono::milliseconds kSynthesisTimeout{30000};

  explicit PiperSynthesizer(std::string voice_model_path, std::string binary = "piper");

  void Synthesize(const std::string& text, const std::string& output_path) override;

 private:
  const std::string voice_model_path_;
  const std::string binary_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_PIPER_SYNTHESIZER_HPP_
