// Repository: Jukebox-controller
// Component: Player Service
// Purpose: Routes transport-agnostic playback actions to the backend workers.
// Copyright (c) 2026 Jukebox

#include "jukebox/player/PlayerService.hpp"

#include <algorithm>
#include <utility>

#include "jukebox/runtime/Completion.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::player {

using state::SourceKind;
using util::Logger;

namespace {

SourceKind KindFor(sources::MediaSourceKind kind) {
  switch (kind) {
    case sources::MediaSourceKind::kSequencerPlaylist:
      return SourceKind::kSequencer;
    case sources::MediaSourceKind::kVideoChannel:
      return SourceKind::kVideo;
  }
  return SourceKind::kNone;
}

}  // namespace

PlayerService::PlayerService(PlayerBackends backends,
                             state::SharedPlaybackState& state,
                             sources::SourceManager& sources,
                             backends::IPersistenceStore& store,
                             PlayerServiceOptions options)
    : state_(state),
      sources_(sources),
      options_(std::move(options)),
      system_volume_(std::move(backends.mixer), store) {
  sequencer_ = std::make_unique<workers::SequencerWorker>(
      std::move(backends.sequencer), state_, options_.sequencer);
  video_ = std::make_unique<workers::VideoWorker>(
      std::move(backends.video_source), std::move(backends.video_launcher), store, state_,
      options_.video);
  announcer_ = std::make_unique<workers::AnnouncerWorker>(
      std::move(backends.synthesizer), std::move(backends.announcement_launcher),
      std::move(backends.probe), media::AnnouncementCache(options_.announcement_cache_dir),
      this, options_.announcer);
}

PlayerService::~PlayerService() { Stop(); }

void PlayerService::Start() {
  sequencer_->Start();
  video_->Start();
  announcer_->Start();
  Logger::Info("[PlayerService] workers started");

  std::lock_guard<std::mutex> lock(switch_mutex_);
  auto current = sources_.GetCurrent();
  if (!current) {
    Logger::Warn("[PlayerService] no current source available");
    return;
  }
  SwitchTo(*current);
}

void PlayerService::Stop() {
  {
    std::lock_guard<std::mutex> lock(switch_mutex_);
    if (stopped_) return;
    stopped_ = true;
  }
  // Announcer first: its completion callbacks talk to the sequencer.
  if (!announcer_->StopThread()) {
    Logger::Warn("[PlayerService] announcer did not stop in time");
  }
  if (!video_->StopThread()) {
    Logger::Warn("[PlayerService] video worker did not stop in time");
  }
  if (!sequencer_->StopThread()) {
    Logger::Warn("[PlayerService] sequencer worker did not stop in time");
  }
  sources_.FlushPendingIndex();
  Logger::Info("[PlayerService] stopped");
}

bool PlayerService::IsReady() const {
  return sequencer_->HasStarted() && video_->HasStarted() && announcer_->HasStarted();
}

void PlayerService::TogglePlay() {
  const state::PlaybackState snapshot = state_.GetSnapshot();
  switch (snapshot.active_source_kind) {
    case SourceKind::kSequencer:
      sequencer_->Toggle();
      break;
    case SourceKind::kVideo:
      if (snapshot.is_playing) {
        video_->Pause();
      } else {
        video_->Resume();
      }
      break;
    case SourceKind::kNone:
      Logger::Info("[PlayerService] toggle play: no active source");
      return;
  }
  Logger::Info(std::string("[PlayerService] toggle play for ") +
               state::ToString(snapshot.active_source_kind));
}

void PlayerService::Next() {
  const SourceKind kind = state_.ActiveSourceKind();
  switch (kind) {
    case SourceKind::kSequencer:
      sequencer_->Next();
      break;
    case SourceKind::kVideo:
      video_->Next();
      break;
    case SourceKind::kNone:
      Logger::Info("[PlayerService] next: no active source");
      return;
  }
  Logger::Info(std::string("[PlayerService] next for ") + state::ToString(kind));
}

void PlayerService::Previous() {
  const SourceKind kind = state_.ActiveSourceKind();
  switch (kind) {
    case SourceKind::kSequencer:
      sequencer_->Previous();
      break;
    case SourceKind::kVideo:
      video_->Previous();
      break;
    case SourceKind::kNone:
      Logger::Info("[PlayerService] previous: no active source");
      return;
  }
  Logger::Info(std::string("[PlayerService] previous for ") + state::ToString(kind));
}

void PlayerService::CycleSource() {
  std::lock_guard<std::mutex> lock(switch_mutex_);
  if (stopped_) return;
  sources::MediaSource next;
  try {
    next = sources_.Next();
  } catch (const sources::EmptySourceList& e) {
    Logger::Warn(std::string("[PlayerService] cycle source: ") + e.what());
    return;
  }
  Announce(std::string(sources::ToString(next.category)) + ", " + next.display_name);
  SwitchTo(next);
}

std::optional<int> PlayerService::GetCurrentVolume() {
  if (state_.ActiveSourceKind() != SourceKind::kSequencer) {
    Logger::Debug("[PlayerService] volume: active source has no volume control");
    return std::nullopt;
  }
  return sequencer_->GetVolume();
}

bool PlayerService::SetVolume(int level, bool synchronous) {
  if (state_.ActiveSourceKind() != SourceKind::kSequencer) {
    Logger::Info("[PlayerService] set volume: active source has no volume control");
    return false;
  }
  level = std::clamp(level, 0, 100);
  if (synchronous) return sequencer_->SetVolumeSync(level);
  sequencer_->SetVolume(level);
  return true;
}

void PlayerService::Announce(const std::string& text) {
  announcer_->Announce(text);
}

void PlayerService::OnAnnouncementStarted() {
  if (state_.ActiveSourceKind() == SourceKind::kSequencer) {
    sequencer_->Duck(options_.duck_level);
  }
}

void PlayerService::OnAnnouncementFinished() {
  // A no-op on the sequencer side when nothing was ducked.
  sequencer_->Unduck();
}

void PlayerService::SwitchTo(const sources::MediaSource& source) {
  const SourceKind old_kind = state_.ActiveSourceKind();
  runtime::CompletionPtr stopped;
  if (old_kind == SourceKind::kSequencer) {
    stopped = std::make_shared<runtime::Completion>();
    sequencer_->Stop(stopped);
  } else if (old_kind == SourceKind::kVideo) {
    stopped = std::make_shared<runtime::Completion>();
    video_->Stop(stopped);
  }

  const SourceKind new_kind = KindFor(source.kind);
  state_.Mutate([new_kind](state::PlaybackState& s) {
    s.active_source_kind = new_kind;
    s.is_playing = false;
    s.current_track.reset();
    s.position_seconds.reset();
    s.duration_seconds.reset();
  });

  LoadSource(source, std::move(stopped));
  Logger::Info(std::string("[PlayerService] switched ") + state::ToString(old_kind) + " -> " +
               state::ToString(new_kind) + " ('" + source.display_name + "')");
}

void PlayerService::LoadSource(const sources::MediaSource& source, runtime::CompletionPtr after) {
  switch (source.kind) {
    case sources::MediaSourceKind::kSequencerPlaylist:
      sequencer_->LoadPlaylist(source.locator, /*shuffle=*/true, /*autoplay=*/true,
                               std::move(after));
      break;
    case sources::MediaSourceKind::kVideoChannel:
      video_->PlayChannel(source.locator, std::move(after));
      break;
  }
}

}  // namespace jukebox::player
