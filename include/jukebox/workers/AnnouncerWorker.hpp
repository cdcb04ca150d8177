// Repository: Jukebox-controller
// Component: Announcer Worker
// Purpose: Speaks short texts through a cached TTS artifact, interrupting the previous one.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_WORKERS_ANNOUNCER_WORKER_HPP_
#define JUKEBOX_WORKERS_ANNOUNCER_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "jukebox/backends/IPlayerLauncher.hpp"
#include "jukebox/backends/ISpeechSynthesizer.hpp"
#include "jukebox/media/AnnouncementCache.hpp"
#include "jukebox/media/MediaProbe.hpp"
#include "jukebox/runtime/Worker.hpp"

namespace jukebox::workers {

// Told when announcement audio starts and when the last one ends. Replacing
// an announcement with another does not produce a Finished/Started pair.
class IAnnouncementListener {
 public:
  virtual ~IAnnouncementListener() = default;
  virtual void OnAnnouncementStarted() = 0;
  virtual void OnAnnouncementFinished() = 0;
};

namespace announcer {

struct Announce {
  std::string text;
};

}  // namespace announcer

using AnnouncerCommand = std::variant<runtime::ShutdownCommand, announcer::Announce>;

struct AnnouncerWorkerOptions {
  runtime::WorkerTiming timing{std::chrono::milliseconds(200), std::chrono::milliseconds(5000), 64};
  std::chrono::milliseconds terminate_grace{5000};
};

class AnnouncerWorker : public runtime::Worker<AnnouncerCommand> {
 public:
  // `listener` may be null and must outlive the worker.
  AnnouncerWorker(std::unique_ptr<backends::ISpeechSynthesizer> synthesizer,
                  std::unique_ptr<backends::IPlayerLauncher> launcher,
                  std::unique_ptr<media::IMediaProbe> probe,
                  media::AnnouncementCache cache,
                  IAnnouncementListener* listener,
                  AnnouncerWorkerOptions options = {});
  ~AnnouncerWorker() override;

  void Announce(const std::string& text);

  bool IsDisabled() const { return disabled_.load(std::memory_order_acquire); }

 protected:
  void HandleCommand(AnnouncerCommand& command) override;
  void Poll() override;
  void OnStopped() override;

 private:
  void DoAnnounce(const std::string& text);
  // Returns the artifact path, or std::nullopt if synthesis failed.
  std::optional<std::string> EnsureArtifact(const std::string& text);
  void StopProcess();
  void NotifyFinished();
  void Disable(const std::string& reason);

  std::unique_ptr<backends::ISpeechSynthesizer> synthesizer_;
  std::unique_ptr<backends::IPlayerLauncher> launcher_;
  std::unique_ptr<media::IMediaProbe> probe_;
  const media::AnnouncementCache cache_;
  IAnnouncementListener* const listener_;
  const AnnouncerWorkerOptions options_;

  // Worker thread only.
  std::unique_ptr<backends::IPlayerProcess> process_;
  bool announcing_ = false;

  std::atomic<bool> disabled_{false};
};

}  // namespace jukebox::workers

#endif  // JUKEBOX_WORKERS_ANNOUNCER_WORKER_HPP_
