// Repository: Jukebox-controller
// Component: Fake Sequencer Client
// Purpose: Scriptable ISequencerClient for worker and service tests.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_TESTS_FIXTURES_FAKE_SEQUENCER_CLIENT_H_
#define JUKEBOX_TESTS_FIXTURES_FAKE_SEQUENCER_CLIENT_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "fixtures/CallLog.h"
#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/backends/ISequencerClient.hpp"

namespace jukebox::tests::fixtures {

// Every call is recorded in the CallLog as "seq:<call>" (Load as
// "seq:load:<locator>"). Failures are injected through the public knobs.
class FakeSequencerClient : public backends::ISequencerClient {
 public:
  explicit FakeSequencerClient(std::shared_ptr<CallLog> log = std::make_shared<CallLog>())
      : log_(std::move(log)) {}

  // Knobs, settable from the test thread.
  std::atomic<bool> refuse_connect{false};
  std::atomic<int> fail_next_commands{0};
  std::atomic<bool> drop_connection{false};
  std::atomic<int> command_delay_ms{0};

  void Connect(const std::string& host, int port) override {
    connect_attempts_.fetch_add(1);
    log_->Append("seq:connect");
    if (refuse_connect.load()) {
      throw backends::ConnectionFailure("refused " + host + ":" + std::to_string(port));
    }
    connected_.store(true);
  }

  void Disconnect() override {
    connected_.store(false);
    log_->Append("seq:disconnect");
  }

  void Play() override {
    Command("play");
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = backends::SequencerPhase::kPlaying;
  }

  void Pause() override {
    Command("pause");
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = backends::SequencerPhase::kPaused;
  }

  void Next() override { Command("next"); }
  void Previous() override { Command("previous"); }

  void Stop() override {
    Command("stop");
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = backends::SequencerPhase::kStopped;
  }

  void Load(const std::string& locator, bool /*shuffle*/, bool autoplay) override {
    Command("load:" + locator);
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = autoplay ? backends::SequencerPhase::kPlaying : backends::SequencerPhase::kStopped;
  }

  int GetVolume() override {
    Command("getvol");
    std::lock_guard<std::mutex> lock(mutex_);
    return volume_;
  }

  void SetVolume(int level) override {
    Command("setvol:" + std::to_string(level));
    std::lock_guard<std::mutex> lock(mutex_);
    volume_ = level;
  }

  backends::SequencerPhase GetPhase() override {
    Guard();
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
  }

  std::optional<state::TrackInfo> GetCurrentItem() override {
    Guard();
    std::lock_guard<std::mutex> lock(mutex_);
    return track_;
  }

  backends::SequencerTime GetTime() override {
    Guard();
    backends::SequencerTime t;
    t.position_seconds = 12.0;
    t.duration_seconds = 180.0;
    return t;
  }

  // Test-side accessors.
  void SetPhase(backends::SequencerPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
  }
  void SetVolumeLevel(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    volume_ = level;
  }
  int VolumeLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volume_;
  }
  void SetTrack(std::optional<state::TrackInfo> track) {
    std::lock_guard<std::mutex> lock(mutex_);
    track_ = std::move(track);
  }
  int ConnectAttempts() const { return connect_attempts_.load(); }
  bool Connected() const { return connected_.load(); }
  CallLog& Log() { return *log_; }

 private:
  void Guard() {
    if (drop_connection.load()) {
      connected_.store(false);
      throw backends::ConnectionFailure("connection reset by peer");
    }
  }

  void Command(const std::string& name) {
    Guard();
    if (const int delay = command_delay_ms.load(); delay > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    if (fail_next_commands.load() > 0) {
      fail_next_commands.fetch_sub(1);
      log_->Append("seq:fail:" + name);
      throw backends::CommandFailure("ACK [5@0] {" + name + "} injected");
    }
    log_->Append("seq:" + name);
  }

  std::shared_ptr<CallLog> log_;
  mutable std::mutex mutex_;
  backends::SequencerPhase phase_ = backends::SequencerPhase::kStopped;
  int volume_ = 80;
  std::optional<state::TrackInfo> track_;
  std::atomic<int> connect_attempts_{0};
  std::atomic<bool> connected_{false};
};

}  // namespace jukebox::tests::fixtures

#endif  // JUKEBOX_TESTS_FIXTURES_FAKE_SEQUENCER_CLIENT_H_
