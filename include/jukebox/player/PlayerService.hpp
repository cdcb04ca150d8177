// Repository: Jukebox-controller
// Component: Player Service
// Purpose: Routes transport-agnostic playback actions to the backend workers.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_PLAYER_PLAYER_SERVICE_HPP_
#define JUKEBOX_PLAYER_PLAYER_SERVICE_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "jukebox/backends/IMixer.hpp"
#include "jukebox/backends/IPersistenceStore.hpp"
#include "jukebox/backends/IPlayerLauncher.hpp"
#include "jukebox/backends/ISequencerClient.hpp"
#include "jukebox/backends/ISpeechSynthesizer.hpp"
#include "jukebox/backends/IVideoSource.hpp"
#include "jukebox/media/MediaProbe.hpp"
#include "jukebox/player/SystemVolume.hpp"
#include "jukebox/sources/SourceManager.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"
#include "jukebox/workers/AnnouncerWorker.hpp"
#include "jukebox/workers/SequencerWorker.hpp"
#include "jukebox/workers/VideoWorker.hpp"

namespace jukebox::player {

// Everything the service hands to its workers. All members are required.
struct PlayerBackends {
  std::unique_ptr<backends::ISequencerClient> sequencer;
  std::unique_ptr<backends::IVideoSource> video_source;
  std::unique_ptr<backends::IPlayerLauncher> video_launcher;
  std::unique_ptr<backends::ISpeechSynthesizer> synthesizer;
  std::unique_ptr<backends::IPlayerLauncher> announcement_launcher;
  std::unique_ptr<media::IMediaProbe> probe;
  std::unique_ptr<backends::IMixer> mixer;
};

struct PlayerServiceOptions {
  workers::SequencerWorkerOptions sequencer;
  workers::VideoWorkerOptions video;
  workers::AnnouncerWorkerOptions announcer;
  std::string announcement_cache_dir = "/var/lib/jukebox/announcements";
  // Sequencer volume while an announcement plays.
  int duck_level = 30;
};

// PlayerService is the single entry point for every inbound transport
// (buttons, gRPC). Each action is routed by the active source kind in the
// shared state to the matching worker's queue; none of them blocks except
// the synchronous volume path.
//
// Source switches are serialized: the previous backend is told to stop and
// the new one only loads after that stop has been attempted (bounded wait on
// the new worker's thread, never on the caller's).
class PlayerService : public workers::IAnnouncementListener {
 public:
  PlayerService(PlayerBackends backends,
                state::SharedPlaybackState& state,
                sources::SourceManager& sources,
                backends::IPersistenceStore& store,
                PlayerServiceOptions options = {});
  ~PlayerService() override;

  PlayerService(const PlayerService&) = delete;
  PlayerService& operator=(const PlayerService&) = delete;

  // Starts the workers and loads the current source.
  void Start();
  // Shuts every worker down through its queue and flushes the pending source
  // index. Idempotent.
  void Stop();
  bool IsReady() const;

  void TogglePlay();
  void Next();
  void Previous();
  void CycleSource();

  // Blocks up to the sequencer volume timeout. std::nullopt when no volume
  // is available for the active source.
  std::optional<int> GetCurrentVolume();
  // With `synchronous`, returns once the backend applied the level (or the
  // timeout expired). Otherwise always returns true.
  bool SetVolume(int level, bool synchronous = false);
  void Announce(const std::string& text);

  SystemVolume& System() { return system_volume_; }
  sources::SourceManager& Sources() { return sources_; }
  state::SharedPlaybackState& State() { return state_; }

  // workers::IAnnouncementListener, called on the announcer thread.
  void OnAnnouncementStarted() override;
  void OnAnnouncementFinished() override;

 private:
  void SwitchTo(const sources::MediaSource& source);
  void LoadSource(const sources::MediaSource& source, runtime::CompletionPtr after);

  state::SharedPlaybackState& state_;
  sources::SourceManager& sources_;
  const PlayerServiceOptions options_;

  SystemVolume system_volume_;

  // Serializes source switches.
  std::mutex switch_mutex_;
  bool stopped_ = false;

  std::unique_ptr<workers::SequencerWorker> sequencer_;
  std::unique_ptr<workers::VideoWorker> video_;
  // Last: holds a pointer back to this service and calls into sequencer_.
  std::unique_ptr<workers::AnnouncerWorker> announcer_;
};

}  // namespace jukebox::player

#endif  // JUKEBOX_PLAYER_PLAYER_SERVICE_HPP_
