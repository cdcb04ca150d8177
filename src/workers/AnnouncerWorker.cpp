// Repository: Jukebox-controller
// Component: Announcer Worker
// Purpose: Speaks short texts through a cached TTS artifact, interrupting the previous one.
// Copyright (c) 2026 Jukebox

#include "jukebox/workers/AnnouncerWorker.hpp"

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/runtime/Overloaded.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::workers {

using runtime::Overloaded;
using util::Logger;

namespace {

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

AnnouncerWorker::AnnouncerWorker(std::unique_ptr<backends::ISpeechSynthesizer> synthesizer,
                                 std::unique_ptr<backends::IPlayerLauncher> launcher,
                                 std::unique_ptr<media::IMediaProbe> probe,
                                 media::AnnouncementCache cache,
                                 IAnnouncementListener* listener,
                                 AnnouncerWorkerOptions options)
    : Worker("AnnouncerWorker", options.timing),
      synthesizer_(std::move(synthesizer)),
      launcher_(std::move(launcher)),
      probe_(std::move(probe)),
      cache_(std::move(cache)),
      listener_(listener),
      options_(std::move(options)) {}

AnnouncerWorker::~AnnouncerWorker() {
  JoinOnDestruction();
}

void AnnouncerWorker::Announce(const std::string& text) {
  if (IsBlank(text)) {
    Logger::Warn("[AnnouncerWorker] empty text, nothing to announce");
    return;
  }
  Enqueue(announcer::Announce{text});
}

void AnnouncerWorker::HandleCommand(AnnouncerCommand& command) {
  std::visit(Overloaded{
                 [](const runtime::ShutdownCommand&) {},
                 [this](const announcer::Announce& c) { DoAnnounce(c.text); },
             },
             command);
}

void AnnouncerWorker::DoAnnounce(const std::string& text) {
  if (IsDisabled()) {
    Logger::Debug("[AnnouncerWorker] announcements disabled, dropping: " + text);
    return;
  }

  auto artifact = EnsureArtifact(text);
  if (!artifact) return;

  // Interrupt-and-replace: the old process is gone before the new one starts.
  StopProcess();
  try {
    process_ = launcher_->Spawn(*artifact);
  } catch (const backends::ResourceUnavailable& e) {
    Disable(e.what());
    NotifyFinished();
    return;
  } catch (const backends::CommandFailure& e) {
    Logger::Error(std::string("[AnnouncerWorker] cannot play announcement: ") + e.what());
    NotifyFinished();
    return;
  }

  Logger::Info("[AnnouncerWorker] announcing: " + text);
  if (!announcing_) {
    announcing_ = true;
    if (listener_) listener_->OnAnnouncementStarted();
  }
}

std::optional<std::string> AnnouncerWorker::EnsureArtifact(const std::string& text) {
  const std::string path = cache_.PathFor(text);
  if (cache_.Contains(text)) {
    Logger::Debug("[AnnouncerWorker] cache hit " + path);
    return path;
  }

  try {
    synthesizer_->Synthesize(text, path);
  } catch (const backends::ResourceUnavailable& e) {
    Disable(e.what());
    return std::nullopt;
  } catch (const backends::CommandFailure& e) {
    Logger::Error(std::string("[AnnouncerWorker] synthesis failed: ") + e.what());
    cache_.Evict(text);
    return std::nullopt;
  }

  auto duration = probe_->ProbeDurationSeconds(path);
  if (!duration) {
    Logger::Error("[AnnouncerWorker] synthesized artifact is not playable audio: " + path);
    cache_.Evict(text);
    return std::nullopt;
  }
  Logger::Debug("[AnnouncerWorker] synthesized " + path + " (" +
                std::to_string(*duration) + "s)");
  return path;
}

void AnnouncerWorker::Poll() {
  if (!process_) return;
  if (process_->Poll()) {
    process_.reset();
    NotifyFinished();
  }
}

void AnnouncerWorker::OnStopped() {
  StopProcess();
  NotifyFinished();
}

void AnnouncerWorker::StopProcess() {
  if (!process_) return;
  process_->Stop(options_.terminate_grace);
  process_.reset();
}

void AnnouncerWorker::NotifyFinished() {
  if (!announcing_) return;
  announcing_ = false;
  if (listener_) listener_->OnAnnouncementFinished();
}

void AnnouncerWorker::Disable(const std::string& reason) {
  if (!disabled_.exchange(true, std::memory_order_acq_rel)) {
    Logger::Warn("[AnnouncerWorker] announcements disabled: " + reason);
  }
}

}  // namespace jukebox::workers
