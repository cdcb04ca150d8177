// Repository: Jukebox-controller
// Component: Sequencer Worker
// Purpose: Owns the persistent music-sequencer connection: reconnect, commands, status polling.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_WORKERS_SEQUENCER_WORKER_HPP_
#define JUKEBOX_WORKERS_SEQUENCER_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "jukebox/backends/ISequencerClient.hpp"
#include "jukebox/runtime/Completion.hpp"
#include "jukebox/runtime/ReconnectBackoff.hpp"
#include "jukebox/runtime/ResultChannel.hpp"
#include "jukebox/runtime/Worker.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"

namespace jukebox::workers {

namespace sequencer {

struct Play {};
struct Pause {};
// Flips the phase reported by the backend, not a local flag.
struct Toggle {};
struct Next {};
struct Previous {};
struct Stop {
  // Signalled once the stop has been attempted, success or not.
  runtime::CompletionPtr done;
};
struct LoadPlaylist {
  std::string locator;
  bool shuffle = true;
  bool autoplay = true;
  // Set the backend to 100% before loading.
  bool force_full_volume = true;
  // If set, the load waits (bounded) for this latch before touching the backend.
  runtime::CompletionPtr after;
};
struct GetVolume {
  uint64_t ticket = 0;
};
struct SetVolume {
  int level = 0;
  // Present for the synchronous variant.
  std::optional<uint64_t> ack_ticket;
};
// Lowers the volume for an announcement, remembering the level to restore.
struct Duck {
  int level = 0;
};
struct Unduck {};

}  // namespace sequencer

using SequencerCommand =
    std::variant<runtime::ShutdownCommand, sequencer::Play, sequencer::Pause,
                 sequencer::Toggle, sequencer::Next, sequencer::Previous,
                 sequencer::Stop, sequencer::LoadPlaylist, sequencer::GetVolume,
                 sequencer::SetVolume, sequencer::Duck, sequencer::Unduck>;

struct SequencerWorkerOptions {
  std::string host = "localhost";
  int port = 6600;
  runtime::WorkerTiming timing{std::chrono::milliseconds(1500), std::chrono::milliseconds(5000), 64};
  double reconnect_base_seconds = runtime::ReconnectBackoff::kDefaultBaseDelaySeconds;
  double reconnect_max_seconds = runtime::ReconnectBackoff::kDefaultMaxDelaySeconds;
  std::chrono::milliseconds volume_timeout{2000};
  std::chrono::milliseconds barrier_timeout{5000};
};

// SequencerWorker is the only user of its ISequencerClient. While
// disconnected it makes one connection attempt per iteration and backs off;
// commands wait in the queue until the connection is up. Any command failure
// drops the connection to force a clean reconnect.
//
// Volume changes, loads and announcement ducking all run on the worker
// thread, so their relative order is the queue order.
class SequencerWorker : public runtime::Worker<SequencerCommand> {
 public:
  SequencerWorker(std::unique_ptr<backends::ISequencerClient> client,
                  state::SharedPlaybackState& state,
                  SequencerWorkerOptions options = {});
  ~SequencerWorker() override;

  void Play();
  void Pause();
  void Toggle();
  void Next();
  void Previous();
  void Stop(runtime::CompletionPtr done = nullptr);
  void LoadPlaylist(const std::string& locator, bool shuffle = true, bool autoplay = true,
                    runtime::CompletionPtr after = nullptr);

  // Blocks up to volume_timeout. std::nullopt when disconnected, on timeout,
  // or when the backend has no mixer.
  std::optional<int> GetVolume();

  // Fire-and-forget.
  void SetVolume(int level);

  // Blocks up to volume_timeout; true once the backend applied the level.
  bool SetVolumeSync(int level);

  // Announcement attenuation. While ducked, GetVolume reports the level that
  // Unduck will restore, and an explicit SetVolume cancels the duck.
  void Duck(int level);
  void Unduck();

  bool IsConnected() const { return connected_.load(std::memory_order_acquire); }
  runtime::ConnectionPhase Phase() const {
    return phase_.load(std::memory_order_acquire);
  }

 protected:
  void HandleCommand(SequencerCommand& command) override;
  void Poll() override;
  bool PrepareIteration() override;
  void OnStopped() override;

 private:
  void Execute(SequencerCommand& command);
  void MarkDisconnected(const std::string& reason);
  void PublishPhase();
  // Applies fn to the shared state only while the sequencer is the active source.
  void UpdateStateIfActive(const std::function<void(state::PlaybackState&)>& fn);

  std::unique_ptr<backends::ISequencerClient> client_;
  state::SharedPlaybackState& state_;
  const SequencerWorkerOptions options_;

  // Worker thread only.
  runtime::ReconnectBackoff backoff_;
  std::optional<int> ducked_restore_level_;

  std::atomic<bool> connected_{false};
  std::atomic<runtime::ConnectionPhase> phase_{runtime::ConnectionPhase::kDisconnected};

  runtime::ResultChannel<std::optional<int>> volume_results_;
  runtime::ResultChannel<bool> volume_acks_;
};

}  // namespace jukebox::workers

#endif  // JUKEBOX_WORKERS_SEQUENCER_WORKER_HPP_
