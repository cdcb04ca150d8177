// Repository: Jukebox-controller
// Component: Media Probe
// Purpose: Validates audio artifacts and reads their duration.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_MEDIA_MEDIA_PROBE_HPP_
#define JUKEBOX_MEDIA_MEDIA_PROBE_HPP_

#include <optional>
#include <string>

namespace jukebox::media {

class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;

  // Duration in seconds, or std::nullopt if the file is not readable media.
  virtual std::optional<double> ProbeDurationSeconds(const std::string& path) = 0;
};

// libavformat: open the container, read stream info, report its duration.
class FfmpegMediaProbe : public IMediaProbe {
 public:
  std::optional<double> ProbeDurationSeconds(const std::string& path) override;
};

}  // namespace jukebox::media

#endif  // JUKEBOX_MEDIA_MEDIA_PROBE_HPP_
