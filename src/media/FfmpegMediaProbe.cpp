// Repository: Jukebox-controller
// Component: Media Probe
// Purpose: Probes announcement artifacts for duration using FFmpeg.
// Copyright (c) 2026 Jukebox

#include "jukebox/media/MediaProbe.hpp"

#include <chrono>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "jukebox/util/Logger.hpp"

namespace jukebox::media {

std::optional<double> FfmpegMediaProbe::ProbeDurationSeconds(const std::string& path) {
  AVFormatContext* fmt_ctx = nullptr;

  auto open_start = std::chrono::steady_clock::now();
  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    util::Logger::Warn("[MediaProbe] Failed to open: " + path);
    return std::nullopt;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[MediaProbe] No stream info: " + path);
    return std::nullopt;
  }

  bool has_audio = false;
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    if (fmt_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
      has_audio = true;
      break;
    }
  }

  double duration_seconds = 0.0;
  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    duration_seconds = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }
  avformat_close_input(&fmt_ctx);

  if (!has_audio) {
    util::Logger::Warn("[MediaProbe] No audio stream: " + path);
    return std::nullopt;
  }

  auto probe_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - open_start).count();
  util::Logger::Debug("[MediaProbe] Probed: " + path + " (" +
                      std::to_string(static_cast<int64_t>(duration_seconds * 1000)) +
                      "ms audio, probe " + std::to_string(probe_ms) + "ms)");
  return duration_seconds;
}

}  // namespace jukebox::media
