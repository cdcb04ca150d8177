// Repository: Jukebox-controller
// Component: Sequencer Worker
// Purpose: Owns the persistent music-sequencer connection: reconnect, commands, status polling.
// Copyright (c) 2026 Jukebox

#include "jukebox/workers/SequencerWorker.hpp"

#include <algorithm>
#include <sstream>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/runtime/Overloaded.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::workers {

using backends::SequencerPhase;
using runtime::Overloaded;
using util::Logger;

SequencerWorker::SequencerWorker(std::unique_ptr<backends::ISequencerClient> client,
                                 state::SharedPlaybackState& state,
                                 SequencerWorkerOptions options)
    : Worker("SequencerWorker", options.timing),
      client_(std::move(client)),
      state_(state),
      options_(std::move(options)),
      backoff_(options_.reconnect_base_seconds, options_.reconnect_max_seconds) {}

SequencerWorker::~SequencerWorker() {
  JoinOnDestruction();
}

void SequencerWorker::Play() { Enqueue(sequencer::Play{}); }

void SequencerWorker::Pause() { Enqueue(sequencer::Pause{}); }

void SequencerWorker::Toggle() { Enqueue(sequencer::Toggle{}); }

void SequencerWorker::Next() { Enqueue(sequencer::Next{}); }

void SequencerWorker::Previous() { Enqueue(sequencer::Previous{}); }

void SequencerWorker::Stop(runtime::CompletionPtr done) {
  if (!Enqueue(sequencer::Stop{done}) && done) {
    // Dropped: do not leave a pending load waiting for the full barrier.
    done->Signal();
  }
}

void SequencerWorker::LoadPlaylist(const std::string& locator, bool shuffle, bool autoplay,
                                   runtime::CompletionPtr after) {
  sequencer::LoadPlaylist load;
  load.locator = locator;
  load.shuffle = shuffle;
  load.autoplay = autoplay;
  load.after = std::move(after);
  Enqueue(std::move(load));
}

std::optional<int> SequencerWorker::GetVolume() {
  if (!IsConnected()) {
    Logger::Debug("[SequencerWorker] GetVolume: not connected");
    return std::nullopt;
  }
  const uint64_t ticket = volume_results_.NextTicket();
  if (!Enqueue(sequencer::GetVolume{ticket})) {
    volume_results_.Cancel(ticket);
    return std::nullopt;
  }
  auto reply = volume_results_.WaitFor(ticket, options_.volume_timeout);
  if (!reply) {
    Logger::Warn("[SequencerWorker] GetVolume timed out after " +
                 std::to_string(options_.volume_timeout.count()) + "ms");
    return std::nullopt;
  }
  return *reply;
}

void SequencerWorker::SetVolume(int level) {
  Enqueue(sequencer::SetVolume{std::clamp(level, 0, 100), std::nullopt});
}

bool SequencerWorker::SetVolumeSync(int level) {
  if (!IsConnected()) return false;
  const uint64_t ticket = volume_acks_.NextTicket();
  if (!Enqueue(sequencer::SetVolume{std::clamp(level, 0, 100), ticket})) {
    volume_acks_.Cancel(ticket);
    return false;
  }
  auto ack = volume_acks_.WaitFor(ticket, options_.volume_timeout);
  return ack.value_or(false);
}

void SequencerWorker::Duck(int level) {
  Enqueue(sequencer::Duck{std::clamp(level, 0, 100)});
}

void SequencerWorker::Unduck() { Enqueue(sequencer::Unduck{}); }

bool SequencerWorker::PrepareIteration() {
  if (backoff_.IsConnected()) return true;

  backoff_.BeginAttempt();
  PublishPhase();
  try {
    client_->Connect(options_.host, options_.port);
    backoff_.OnConnected();
    connected_.store(true, std::memory_order_release);
    PublishPhase();
    Logger::Info("[SequencerWorker] connected to " + options_.host + ":" +
                 std::to_string(options_.port));
    return true;
  } catch (const std::runtime_error& e) {
    const double delay = backoff_.OnAttemptFailed();
    PublishPhase();
    std::ostringstream msg;
    msg << "[SequencerWorker] connect to " << options_.host << ":" << options_.port
        << " failed: " << e.what() << "; retrying in " << delay << "s";
    Logger::Warn(msg.str());
    SleepUnlessStopping(runtime::ReconnectBackoff::ToDuration(delay));
    return false;
  }
}

void SequencerWorker::HandleCommand(SequencerCommand& command) {
  try {
    Execute(command);
    return;
  } catch (const backends::ConnectionFailure& e) {
    MarkDisconnected(e.what());
  } catch (const backends::CommandFailure& e) {
    Logger::Error(std::string("[SequencerWorker] command failed: ") + e.what());
    MarkDisconnected("protocol state unknown after command failure");
  }

  // Release waiters of the failed command so no caller or dependent load
  // sits out the full timeout.
  std::visit(Overloaded{
                 [this](const sequencer::GetVolume& c) {
                   volume_results_.Publish(c.ticket, std::nullopt);
                 },
                 [this](const sequencer::SetVolume& c) {
                   if (c.ack_ticket) volume_acks_.Publish(*c.ack_ticket, false);
                 },
                 [](const sequencer::Stop& c) {
                   if (c.done) c.done->Signal();
                 },
                 [](const auto&) {},
             },
             command);
}

void SequencerWorker::Execute(SequencerCommand& command) {
  std::visit(
      Overloaded{
          [](const runtime::ShutdownCommand&) {},
          [this](const sequencer::Play&) {
            client_->Play();
            UpdateStateIfActive([](state::PlaybackState& s) { s.is_playing = true; });
          },
          [this](const sequencer::Pause&) {
            client_->Pause();
            UpdateStateIfActive([](state::PlaybackState& s) { s.is_playing = false; });
          },
          [this](const sequencer::Toggle&) {
            const SequencerPhase phase = client_->GetPhase();
            if (phase == SequencerPhase::kPlaying) {
              client_->Pause();
            } else {
              client_->Play();
            }
            const bool now_playing = phase != SequencerPhase::kPlaying;
            Logger::Info(std::string("[SequencerWorker] toggle: ") +
                         backends::ToString(phase) + " -> " +
                         (now_playing ? "playing" : "paused"));
            UpdateStateIfActive([now_playing](state::PlaybackState& s) {
              s.is_playing = now_playing;
            });
          },
          [this](const sequencer::Next&) { client_->Next(); },
          [this](const sequencer::Previous&) { client_->Previous(); },
          [this](const sequencer::Stop& c) {
            client_->Stop();
            Logger::Info("[SequencerWorker] stopped playback");
            if (c.done) c.done->Signal();
          },
          [this](const sequencer::LoadPlaylist& c) {
            if (c.after && !c.after->WaitFor(options_.barrier_timeout)) {
              Logger::Warn("[SequencerWorker] previous source did not confirm stop within " +
                           std::to_string(options_.barrier_timeout.count()) +
                           "ms, loading anyway");
            }
            if (c.force_full_volume) {
              if (ducked_restore_level_) {
                ducked_restore_level_ = 100;
              } else {
                client_->SetVolume(100);
              }
            }
            client_->Load(c.locator, c.shuffle, c.autoplay);
            Logger::Info("[SequencerWorker] loaded " + c.locator);
            UpdateStateIfActive([&c](state::PlaybackState& s) {
              s.is_playing = c.autoplay;
              s.current_track.reset();
              s.position_seconds.reset();
              s.duration_seconds.reset();
            });
          },
          [this](const sequencer::GetVolume& c) {
            const int volume = ducked_restore_level_ ? *ducked_restore_level_
                                                     : client_->GetVolume();
            volume_results_.Publish(c.ticket, volume);
          },
          [this](const sequencer::SetVolume& c) {
            ducked_restore_level_.reset();
            client_->SetVolume(c.level);
            if (c.ack_ticket) volume_acks_.Publish(*c.ack_ticket, true);
          },
          [this](const sequencer::Duck& c) {
            if (ducked_restore_level_) return;
            const int current = client_->GetVolume();
            if (current <= c.level) return;
            ducked_restore_level_ = current;
            client_->SetVolume(c.level);
            Logger::Debug("[SequencerWorker] ducked " + std::to_string(current) + " -> " +
                          std::to_string(c.level));
          },
          [this](const sequencer::Unduck&) {
            if (!ducked_restore_level_) return;
            const int level = *ducked_restore_level_;
            client_->SetVolume(level);
            ducked_restore_level_.reset();
            Logger::Debug("[SequencerWorker] restored volume " + std::to_string(level));
          },
      },
      command);
}

void SequencerWorker::Poll() {
  if (!backoff_.IsConnected()) return;
  if (state_.ActiveSourceKind() != state::SourceKind::kSequencer) return;

  try {
    const SequencerPhase phase = client_->GetPhase();
    std::optional<state::TrackInfo> track;
    backends::SequencerTime time;
    if (phase != SequencerPhase::kStopped) {
      track = client_->GetCurrentItem();
      time = client_->GetTime();
    }
    UpdateStateIfActive([&](state::PlaybackState& s) {
      s.is_playing = phase == SequencerPhase::kPlaying;
      s.current_track = track;
      s.position_seconds = time.position_seconds;
      s.duration_seconds = time.duration_seconds;
    });
  } catch (const backends::ConnectionFailure& e) {
    MarkDisconnected(e.what());
  } catch (const backends::CommandFailure& e) {
    Logger::Debug(std::string("[SequencerWorker] poll skipped: ") + e.what());
  }
}

void SequencerWorker::OnStopped() {
  if (backoff_.IsConnected()) {
    client_->Disconnect();
  }
  backoff_.OnConnectionLost();
  connected_.store(false, std::memory_order_release);
  PublishPhase();
}

void SequencerWorker::MarkDisconnected(const std::string& reason) {
  Logger::Warn("[SequencerWorker] disconnected: " + reason);
  client_->Disconnect();
  backoff_.OnConnectionLost();
  connected_.store(false, std::memory_order_release);
  PublishPhase();
}

void SequencerWorker::PublishPhase() {
  phase_.store(backoff_.Phase(), std::memory_order_release);
}

void SequencerWorker::UpdateStateIfActive(
    const std::function<void(state::PlaybackState&)>& fn) {
  state_.Mutate([&fn](state::PlaybackState& s) {
    if (s.active_source_kind == state::SourceKind::kSequencer) fn(s);
  });
}

}  // namespace jukebox::workers
