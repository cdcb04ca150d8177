// Repository: Jukebox-controller
// Component: Video Worker
// Purpose: Plays channel items one by one through an external player, skipping watched items.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_WORKERS_VIDEO_WORKER_HPP_
#define JUKEBOX_WORKERS_VIDEO_WORKER_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include "jukebox/backends/IPersistenceStore.hpp"
#include "jukebox/backends/IPlayerLauncher.hpp"
#include "jukebox/backends/IVideoSource.hpp"
#include "jukebox/runtime/Completion.hpp"
#include "jukebox/runtime/Worker.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"
#include "jukebox/workers/VideoPlaylist.hpp"

namespace jukebox::workers {

namespace video {

struct PlayChannel {
  std::string locator;
  // If set, waits (bounded) for this latch before starting playback.
  runtime::CompletionPtr after;
};
struct Next {};
struct Previous {};
struct Stop {
  runtime::CompletionPtr done;
};
struct Pause {};
struct Resume {};

}  // namespace video

using VideoCommand =
    std::variant<runtime::ShutdownCommand, video::PlayChannel, video::Next,
                 video::Previous, video::Stop, video::Pause, video::Resume>;

struct VideoWorkerOptions {
  int max_videos = 50;
  runtime::WorkerTiming timing{std::chrono::milliseconds(1000), std::chrono::milliseconds(5000), 64};
  std::chrono::milliseconds terminate_grace{5000};
  std::chrono::milliseconds barrier_timeout{5000};
};

// VideoWorker owns the channel list, the watched set and at most one player
// process. All of them are touched only by the worker thread.
//
// next() and an auto-advance triggered by a finished process both run on the
// worker thread in queue/poll order; whichever runs later moves the index
// from where the earlier one left it.
class VideoWorker : public runtime::Worker<VideoCommand> {
 public:
  static constexpr const char* kTrackArtist = "YouTube";

  VideoWorker(std::unique_ptr<backends::IVideoSource> source,
              std::unique_ptr<backends::IPlayerLauncher> launcher,
              backends::IPersistenceStore& store,
              state::SharedPlaybackState& state,
              VideoWorkerOptions options = {});
  ~VideoWorker() override;

  void PlayChannel(const std::string& locator, runtime::CompletionPtr after = nullptr);
  void Next();
  void Previous();
  void Stop(runtime::CompletionPtr done = nullptr);
  void Pause();
  void Resume();

 protected:
  void HandleCommand(VideoCommand& command) override;
  void Poll() override;
  void OnStopped() override;

 private:
  void Execute(VideoCommand& command);
  void DoPlayChannel(const video::PlayChannel& command);
  // Plays the next unwatched item from the current index. An item whose
  // stream cannot be resolved is marked watched and skipped; at most one
  // attempt per item.
  void PlayFromSelection();
  bool PlayItem(const backends::VideoItem& item);
  void StopProcess();
  void MarkWatched(const std::string& id);
  void MarkNotPlaying();
  void UpdateStateIfActive(const std::function<void(state::PlaybackState&)>& fn);

  std::unique_ptr<backends::IVideoSource> source_;
  std::unique_ptr<backends::IPlayerLauncher> launcher_;
  backends::IPersistenceStore& store_;
  state::SharedPlaybackState& state_;
  const VideoWorkerOptions options_;

  // Worker thread only.
  VideoPlaylist playlist_;
  std::set<std::string> watched_;
  std::unique_ptr<backends::IPlayerProcess> process_;
  bool paused_ = false;
  std::optional<std::string> disabled_reason_;
};

}  // namespace jukebox::workers

#endif  // JUKEBOX_WORKERS_VIDEO_WORKER_HPP_
