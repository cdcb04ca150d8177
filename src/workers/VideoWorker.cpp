// Repository: Jukebox-controller
// Component: Video Worker
// Purpose: Plays channel items one by one through an external player, skipping watched items.
// Copyright (c) 2026 Jukebox

#include "jukebox/workers/VideoWorker.hpp"

#include <string>
#include <vector>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/runtime/Overloaded.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::workers {

using runtime::Overloaded;
using util::Logger;

VideoWorker::VideoWorker(std::unique_ptr<backends::IVideoSource> source,
                         std::unique_ptr<backends::IPlayerLauncher> launcher,
                         backends::IPersistenceStore& store,
                         state::SharedPlaybackState& state,
                         VideoWorkerOptions options)
    : Worker("VideoWorker", options.timing),
      source_(std::move(source)),
      launcher_(std::move(launcher)),
      store_(store),
      state_(state),
      options_(std::move(options)),
      watched_(store.LoadWatchedSet()) {
  Logger::Info("[VideoWorker] " + std::to_string(watched_.size()) + " items already watched");
}

VideoWorker::~VideoWorker() {
  JoinOnDestruction();
}

void VideoWorker::PlayChannel(const std::string& locator, runtime::CompletionPtr after) {
  Enqueue(video::PlayChannel{locator, std::move(after)});
}

void VideoWorker::Next() { Enqueue(video::Next{}); }

void VideoWorker::Previous() { Enqueue(video::Previous{}); }

void VideoWorker::Stop(runtime::CompletionPtr done) {
  if (!Enqueue(video::Stop{done}) && done) {
    done->Signal();
  }
}

void VideoWorker::Pause() { Enqueue(video::Pause{}); }

void VideoWorker::Resume() { Enqueue(video::Resume{}); }

void VideoWorker::HandleCommand(VideoCommand& command) {
  if (disabled_reason_) {
    Logger::Debug("[VideoWorker] ignoring command, video disabled: " + *disabled_reason_);
    if (auto* stop = std::get_if<video::Stop>(&command); stop && stop->done) {
      stop->done->Signal();
    }
    return;
  }

  try {
    Execute(command);
  } catch (const backends::ResourceUnavailable& e) {
    disabled_reason_ = e.what();
    Logger::Warn(std::string("[VideoWorker] video playback disabled: ") + e.what());
    StopProcess();
    MarkNotPlaying();
  } catch (const backends::CommandFailure& e) {
    Logger::Error(std::string("[VideoWorker] command failed: ") + e.what());
  }

  if (auto* stop = std::get_if<video::Stop>(&command); stop && stop->done) {
    stop->done->Signal();
  }
}

void VideoWorker::Execute(VideoCommand& command) {
  std::visit(
      Overloaded{
          [](const runtime::ShutdownCommand&) {},
          [this](const video::PlayChannel& c) { DoPlayChannel(c); },
          [this](const video::Next&) {
            if (playlist_.Empty()) return;
            StopProcess();
            playlist_.Advance(1);
            PlayFromSelection();
          },
          [this](const video::Previous&) {
            if (playlist_.Empty()) return;
            StopProcess();
            playlist_.Advance(-1);
            // Going back replays that item even if it was watched.
            if (!PlayItem(*playlist_.Current())) {
              MarkWatched(playlist_.Current()->id);
              playlist_.Advance(1);
              PlayFromSelection();
            }
          },
          [this](const video::Stop&) {
            StopProcess();
            paused_ = false;
            Logger::Info("[VideoWorker] stopped playback");
          },
          [this](const video::Pause&) {
            if (!process_) return;
            if (!process_->SetPaused(true)) {
              // No control channel: stop now, Resume replays the item.
              StopProcess();
            }
            paused_ = true;
            UpdateStateIfActive([](state::PlaybackState& s) { s.is_playing = false; });
            Logger::Info("[VideoWorker] paused");
          },
          [this](const video::Resume&) {
            if (playlist_.Empty()) return;
            if (process_ && paused_ && process_->SetPaused(false)) {
              paused_ = false;
              UpdateStateIfActive([](state::PlaybackState& s) { s.is_playing = true; });
              Logger::Info("[VideoWorker] resumed");
              return;
            }
            paused_ = false;
            if (!PlayItem(*playlist_.Current())) {
              PlayFromSelection();
            }
          },
      },
      command);
}

void VideoWorker::DoPlayChannel(const video::PlayChannel& c) {
  if (c.after && !c.after->WaitFor(options_.barrier_timeout)) {
    Logger::Warn("[VideoWorker] previous source did not confirm stop within " +
                 std::to_string(options_.barrier_timeout.count()) + "ms, playing anyway");
  }
  StopProcess();
  paused_ = false;

  Logger::Info("[VideoWorker] play channel " + c.locator);
  std::vector<backends::VideoItem> items;
  try {
    items = source_->ListItems(c.locator, options_.max_videos);
  } catch (const backends::CommandFailure& e) {
    Logger::Error(std::string("[VideoWorker] cannot list channel: ") + e.what());
    playlist_.Reset({});
    MarkNotPlaying();
    return;
  }
  playlist_.Reset(std::move(items));
  Logger::Info("[VideoWorker] fetched " + std::to_string(playlist_.Size()) + " items");
  if (playlist_.Empty()) {
    Logger::Error("[VideoWorker] no items in channel " + c.locator);
    MarkNotPlaying();
    return;
  }
  PlayFromSelection();
}

void VideoWorker::PlayFromSelection() {
  const size_t count = playlist_.Size();
  // Positions already attempted in this pass; each is resolved at most once.
  std::vector<bool> tried(count, false);
  size_t tried_count = 0;
  bool looped = false;
  // Unwatched picks never repeat a position, and once looped the walk covers
  // every position in order, so 2 * count steps always suffice.
  for (size_t step = 0; step < 2 * count && tried_count < count; ++step) {
    // Once everything is watched, fall back to walking the list in order.
    const backends::VideoItem* item = looped ? playlist_.Current()
                                             : playlist_.SelectNextUnwatched(watched_, &looped);
    if (looped && step == 0) {
      Logger::Info("[VideoWorker] all items watched, starting over");
    }
    const size_t index = playlist_.Index();
    if (tried[index]) {
      playlist_.Advance(1);
      continue;
    }
    tried[index] = true;
    ++tried_count;
    if (PlayItem(*item)) return;
    MarkWatched(item->id);
    playlist_.Advance(1);
  }
  Logger::Error("[VideoWorker] no playable item in channel");
  MarkNotPlaying();
}

bool VideoWorker::PlayItem(const backends::VideoItem& item) {
  StopProcess();

  std::string playable;
  try {
    playable = source_->ResolvePlayableUrl(item.url);
  } catch (const backends::CommandFailure& e) {
    Logger::Warn("[VideoWorker] skipping '" + item.title + "': " + e.what());
    return false;
  }

  try {
    process_ = launcher_->Spawn(playable);
  } catch (const backends::CommandFailure& e) {
    Logger::Error("[VideoWorker] cannot start player for '" + item.title + "': " + e.what());
    return false;
  }

  paused_ = false;
  MarkWatched(item.id);
  Logger::Info("[VideoWorker] playing: " + item.title);

  state::TrackInfo track;
  track.title = item.title;
  track.artist = kTrackArtist;
  track.album = "";
  track.uri = item.url;
  UpdateStateIfActive([&track](state::PlaybackState& s) {
    s.is_playing = true;
    s.current_track = track;
    s.position_seconds.reset();
    s.duration_seconds.reset();
  });
  return true;
}

void VideoWorker::Poll() {
  if (!process_) return;

  if (auto exit_code = process_->Poll()) {
    process_.reset();
    if (paused_) return;
    Logger::Info("[VideoWorker] item finished (exit " + std::to_string(*exit_code) +
                 "), advancing");
    try {
      playlist_.Advance(1);
      PlayFromSelection();
    } catch (const backends::ResourceUnavailable& e) {
      disabled_reason_ = e.what();
      Logger::Warn(std::string("[VideoWorker] video playback disabled: ") + e.what());
      MarkNotPlaying();
    }
    return;
  }

  if (paused_) return;
  if (auto t = process_->QueryPositionDuration()) {
    UpdateStateIfActive([&t](state::PlaybackState& s) {
      s.position_seconds = t->position_seconds;
      s.duration_seconds = t->duration_seconds;
    });
  }
}

void VideoWorker::OnStopped() {
  StopProcess();
}

void VideoWorker::StopProcess() {
  if (!process_) return;
  process_->Stop(options_.terminate_grace);
  process_.reset();
}

void VideoWorker::MarkWatched(const std::string& id) {
  if (!watched_.insert(id).second) return;
  if (!store_.SaveWatchedIds({id})) {
    Logger::Error("[VideoWorker] failed to persist watched id " + id);
  }
}

void VideoWorker::MarkNotPlaying() {
  UpdateStateIfActive([](state::PlaybackState& s) {
    s.is_playing = false;
    s.current_track.reset();
    s.position_seconds.reset();
    s.duration_seconds.reset();
  });
}

void VideoWorker::UpdateStateIfActive(const std::function<void(state::PlaybackState&)>& fn) {
  state_.Mutate([&fn](state::PlaybackState& s) {
    if (s.active_source_kind == state::SourceKind::kVideo) fn(s);
  });
}

}  // namespace jukebox::workers
