// Repository: Jukebox-controller
// Component: Player service unit tests
// Purpose: Source switching order, per-kind dispatch, volume and ducking.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/CallLog.h"
#include "fixtures/FakeMixer.h"
#include "fixtures/FakePlayerLauncher.h"
#include "fixtures/FakeSequencerClient.h"
#include "fixtures/FakeSpeechBackends.h"
#include "fixtures/FakeVideoSource.h"
#include "fixtures/InMemoryStateStore.h"
#include "jukebox/media/AnnouncementCache.hpp"
#include "jukebox/player/PlayerService.hpp"

namespace jukebox::player {
namespace {

using std::chrono::milliseconds;
using tests::fixtures::CallLog;
using tests::fixtures::FakeMediaProbe;
using tests::fixtures::FakeMixer;
using tests::fixtures::FakePlayerLauncher;
using tests::fixtures::FakeSequencerClient;
using tests::fixtures::FakeSpeechSynthesizer;
using tests::fixtures::FakeVideoSource;
using tests::fixtures::InMemoryStateStore;
using tests::fixtures::WaitUntil;

const char* kPlaylistA = "spotify:playlist:aaa";
const char* kChannelB = "https://www.youtube.com/@news";
const char* kPlaylistC = "spotify:playlist:ccc";

std::vector<sources::MediaSource> MixedSources() {
  return {
      {sources::MediaSourceKind::kSequencerPlaylist, "Morning Mix", kPlaylistA,
       sources::SourceCategory::kMusic},
      {sources::MediaSourceKind::kVideoChannel, "Evening News", kChannelB,
       sources::SourceCategory::kNews},
      {sources::MediaSourceKind::kSequencerPlaylist, "Jazz", kPlaylistC,
       sources::SourceCategory::kMusic},
  };
}

bool IsLoad(const std::string& e) {
  return e.rfind("seq:load:", 0) == 0 || e.rfind("video:spawn:", 0) == 0;
}

bool IsStop(const std::string& e) {
  return e == "seq:stop" || e.rfind("video:stop:", 0) == 0;
}

class PlayerServiceTest : public ::testing::Test {
 protected:
  void Build(std::vector<sources::MediaSource> list) {
    static std::atomic<int> counter{0};
    log_ = std::make_shared<CallLog>();
    store_ = std::make_unique<InMemoryStateStore>(std::move(list), 0);
    sources_ = std::make_unique<sources::SourceManager>(*store_, milliseconds(50));

    PlayerBackends backends;
    auto sequencer = std::make_unique<FakeSequencerClient>(log_);
    sequencer_ = sequencer.get();
    backends.sequencer = std::move(sequencer);
    backends.video_source = std::make_unique<FakeVideoSource>(FakeVideoSource::MakeItems(3));
    auto video_launcher = std::make_unique<FakePlayerLauncher>("video", log_);
    video_launcher_ = video_launcher.get();
    backends.video_launcher = std::move(video_launcher);
    backends.synthesizer = std::make_unique<FakeSpeechSynthesizer>();
    auto announce_launcher = std::make_unique<FakePlayerLauncher>("announce", log_);
    announce_launcher_ = announce_launcher.get();
    backends.announcement_launcher = std::move(announce_launcher);
    backends.probe = std::make_unique<FakeMediaProbe>();
    backends.mixer = std::make_unique<FakeMixer>();

    PlayerServiceOptions options;
    options.sequencer.timing = runtime::WorkerTiming{milliseconds(20), milliseconds(2000), 64};
    options.sequencer.reconnect_base_seconds = 0.02;
    options.sequencer.reconnect_max_seconds = 0.1;
    options.sequencer.volume_timeout = milliseconds(500);
    options.sequencer.barrier_timeout = milliseconds(1000);
    options.video.timing = runtime::WorkerTiming{milliseconds(20), milliseconds(2000), 64};
    options.video.terminate_grace = milliseconds(10);
    options.video.barrier_timeout = milliseconds(1000);
    options.announcer.timing = runtime::WorkerTiming{milliseconds(20), milliseconds(2000), 64};
    options.announcer.terminate_grace = milliseconds(10);
    options.announcement_cache_dir = "/tmp/jukebox_player_test_" + std::to_string(getpid()) +
                                     "_" + std::to_string(counter.fetch_add(1));
    options.duck_level = 30;

    player_ = std::make_unique<PlayerService>(std::move(backends), state_, *sources_, *store_,
                                              options);
  }

  void TearDown() override {
    player_.reset();
    sources_.reset();
  }

  // Every load (or spawn) after the first is preceded by a stop since the
  // previous load.
  void ExpectStopBeforeEveryLoad() {
    bool first = true;
    bool stopped_since_load = false;
    for (const std::string& e : log_->Entries()) {
      if (IsStop(e)) stopped_since_load = true;
      if (!IsLoad(e)) continue;
      if (!first) EXPECT_TRUE(stopped_since_load) << "load without prior stop: " << e;
      first = false;
      stopped_since_load = false;
    }
  }

  std::shared_ptr<CallLog> log_;
  state::SharedPlaybackState state_;
  std::unique_ptr<InMemoryStateStore> store_;
  std::unique_ptr<sources::SourceManager> sources_;
  FakeSequencerClient* sequencer_ = nullptr;
  FakePlayerLauncher* video_launcher_ = nullptr;
  FakePlayerLauncher* announce_launcher_ = nullptr;
  std::unique_ptr<PlayerService> player_;
};

TEST_F(PlayerServiceTest, ReadyOnlyAfterStart) {
  Build(MixedSources());
  EXPECT_FALSE(player_->IsReady());
  player_->Start();
  EXPECT_TRUE(player_->IsReady());
}

TEST_F(PlayerServiceTest, StartLoadsCurrentSource) {
  Build(MixedSources());
  player_->Start();
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistA, 1, milliseconds(2000)));
  EXPECT_EQ(state_.ActiveSourceKind(), state::SourceKind::kSequencer);
}

TEST_F(PlayerServiceTest, CycleStopsOldSourceBeforeLoadingNew) {
  Build(MixedSources());
  player_->Start();
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistA, 1, milliseconds(2000)));

  player_->CycleSource();
  EXPECT_EQ(state_.ActiveSourceKind(), state::SourceKind::kVideo);
  ASSERT_TRUE(WaitUntil([&] { return video_launcher_->SpawnCount() == 1; }));
  ASSERT_GE(log_->IndexOf("seq:stop"), 0);
  EXPECT_LT(log_->IndexOf("seq:stop"),
            log_->IndexOf("video:spawn:" + FakeVideoSource::StreamFor("v0")));

  player_->CycleSource();
  EXPECT_EQ(state_.ActiveSourceKind(), state::SourceKind::kSequencer);
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistC, 1, milliseconds(2000)));
  ASSERT_GE(log_->IndexOf("video:stop:" + FakeVideoSource::StreamFor("v0")), 0);
  EXPECT_LT(log_->IndexOf("video:stop:" + FakeVideoSource::StreamFor("v0")),
            log_->IndexOf(std::string("seq:load:") + kPlaylistC));
}

TEST_F(PlayerServiceTest, RepeatedCyclesKeepStopBeforeLoad) {
  Build(MixedSources());
  player_->Start();
  const std::vector<state::SourceKind> expected{
      state::SourceKind::kVideo, state::SourceKind::kSequencer, state::SourceKind::kSequencer};

  for (int i = 0; i < 7; ++i) {
    player_->CycleSource();
    EXPECT_EQ(state_.ActiveSourceKind(), expected[static_cast<size_t>(i) % expected.size()])
        << "cycle " << i;
  }

  // 1 initial load + 7 switches; the last lands on the video channel.
  ASSERT_TRUE(WaitUntil([&] {
    size_t loads = 0;
    for (const auto& e : log_->Entries()) loads += IsLoad(e) ? 1 : 0;
    return loads == 8;
  }, milliseconds(5000)));
  ExpectStopBeforeEveryLoad();
  EXPECT_EQ(video_launcher_->RunningCount(), 1u);
}

TEST_F(PlayerServiceTest, CycleAnnouncesCategoryAndName) {
  Build(MixedSources());
  player_->Start();
  player_->CycleSource();
  ASSERT_TRUE(WaitUntil([&] { return announce_launcher_->SpawnCount() == 1; }));
  EXPECT_NE(announce_launcher_->Latest()->target.find(
                media::AnnouncementCache::KeyFor("news, Evening News")),
            std::string::npos);
}

TEST_F(PlayerServiceTest, TogglePlayRoutesByActiveKind) {
  Build(MixedSources());
  player_->Start();
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistA, 1, milliseconds(2000)));

  player_->TogglePlay();
  ASSERT_TRUE(log_->WaitForCount("seq:pause", 1, milliseconds(2000)));

  player_->CycleSource();
  ASSERT_TRUE(WaitUntil([&] { return state_.GetSnapshot().is_playing; }));
  player_->TogglePlay();
  EXPECT_TRUE(log_->WaitForCount("video:pause:" + FakeVideoSource::StreamFor("v0"), 1,
                                 milliseconds(2000)));
}

TEST_F(PlayerServiceTest, NextAndPreviousRouteByActiveKind) {
  Build(MixedSources());
  player_->Start();
  player_->Next();
  player_->Previous();
  ASSERT_TRUE(log_->WaitForCount("seq:previous", 1, milliseconds(2000)));
  ASSERT_GE(log_->IndexOf("seq:next"), 0);
  EXPECT_LT(log_->IndexOf("seq:next"), log_->IndexOf("seq:previous"));

  player_->CycleSource();
  ASSERT_TRUE(WaitUntil([&] { return video_launcher_->SpawnCount() == 1; }));
  player_->Next();
  EXPECT_TRUE(log_->WaitForCount("video:spawn:" + FakeVideoSource::StreamFor("v1"), 1,
                                 milliseconds(2000)));
}

TEST_F(PlayerServiceTest, ActionsWithoutActiveSourceAreNoOps) {
  Build({});
  player_->Start();
  player_->TogglePlay();
  player_->Next();
  player_->Previous();
  player_->CycleSource();
  std::this_thread::sleep_for(milliseconds(100));

  for (const auto& e : log_->Entries()) {
    EXPECT_TRUE(e == "seq:connect") << e;
  }
  EXPECT_EQ(state_.ActiveSourceKind(), state::SourceKind::kNone);
  EXPECT_FALSE(player_->GetCurrentVolume().has_value());
}

TEST_F(PlayerServiceTest, VolumeFollowsSequencer) {
  Build(MixedSources());
  player_->Start();
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistA, 1, milliseconds(2000)));

  EXPECT_EQ(player_->GetCurrentVolume(), std::optional<int>(100));
  EXPECT_TRUE(player_->SetVolume(40, /*synchronous=*/true));
  EXPECT_EQ(sequencer_->VolumeLevel(), 40);
  EXPECT_TRUE(player_->SetVolume(150));
  ASSERT_TRUE(log_->WaitForCount("seq:setvol:100", 2, milliseconds(2000)));

  player_->CycleSource();
  EXPECT_FALSE(player_->GetCurrentVolume().has_value());
  EXPECT_FALSE(player_->SetVolume(50, true));
}

TEST_F(PlayerServiceTest, AnnouncementDucksSequencerAndRestores) {
  Build(MixedSources());
  player_->Start();
  ASSERT_TRUE(log_->WaitForCount(std::string("seq:load:") + kPlaylistA, 1, milliseconds(2000)));

  player_->Announce("Good morning");
  ASSERT_TRUE(log_->WaitForCount("seq:setvol:30", 1, milliseconds(2000)));
  ASSERT_TRUE(WaitUntil([&] { return announce_launcher_->SpawnCount() == 1; }));

  announce_launcher_->Latest()->Finish(0);
  ASSERT_TRUE(WaitUntil([&] { return sequencer_->VolumeLevel() == 100; }));
}

TEST_F(PlayerServiceTest, StopFlushesSourceIndexAndStopsWorkers) {
  Build(MixedSources());
  player_->Start();
  player_->CycleSource();
  player_->Stop();

  ASSERT_FALSE(store_->IndexWrites().empty());
  EXPECT_EQ(store_->IndexWrites().back(), 1);
  EXPECT_EQ(video_launcher_->RunningCount(), 0u);
  // Idempotent.
  player_->Stop();
}

}  // namespace
}  // namespace jukebox::player
