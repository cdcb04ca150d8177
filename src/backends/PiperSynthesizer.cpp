// Repository: Jukebox-controller
// Component: Piper Synthesizer
// Purpose: ISpeechSynthesizer backed by the piper TTS command line tool.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/PiperSynthesizer.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/backends/Subprocess.hpp"

namespace jukebox::backends {

PiperSynthesizer::PiperSynthesizer(std::string voice_model_path, std::string binary)
    : voice_model_path_(std::move(voice_model_path)), binary_(std::move(binary)) {}

void PiperSynthesizer::Synthesize(const std::string& text, const std::string& output_path) {
  if (voice_model_path_.empty()) {
    throw ResourceUnavailable("no voice model configured");
  }
  struct stat st;
  if (stat(voice_model_path_.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    throw ResourceUnavailable("voice model not found at " + voice_model_path_);
  }

  CaptureResult r = RunAndCapture(
      {binary_, "--model", voice_model_path_, "--output_file", output_path},
      text, kSynthesisTimeout);
  if (r.timed_out || r.exit_code != 0) {
    unlink(output_path.c_str());
    throw CommandFailure(r.timed_out ? "piper timed out"
                                     : "piper exited with " + std::to_string(r.exit_code) +
                                           ": " + r.stderr_text);
  }
  if (stat(output_path.c_str(), &st) != 0 || st.st_size == 0) {
    unlink(output_path.c_str());
    throw CommandFailure("piper produced no audio at " + output_path);
  }
}

}  // namespace jukebox::backends
