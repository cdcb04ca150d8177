// Repository: Jukebox-controller
// Component: Video worker unit tests
// Purpose: Selection, skip-on-failure, auto-advance and process replacement.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "fixtures/CallLog.h"
#include "fixtures/FakePlayerLauncher.h"
#include "fixtures/FakeVideoSource.h"
#include "fixtures/InMemoryStateStore.h"
#include "jukebox/runtime/Completion.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"
#include "jukebox/util/Logger.hpp"
#include "jukebox/workers/VideoWorker.hpp"

namespace jukebox::workers {
namespace {

using std::chrono::milliseconds;
using tests::fixtures::CallLog;
using tests::fixtures::FakePlayerLauncher;
using tests::fixtures::FakeVideoSource;
using tests::fixtures::InMemoryStateStore;
using tests::fixtures::WaitUntil;

const char* kChannel = "https://www.youtube.com/@channel";

std::string Spawn(const std::string& id) { return "video:spawn:" + FakeVideoSource::StreamFor(id); }
std::string Stop(const std::string& id) { return "video:stop:" + FakeVideoSource::StreamFor(id); }

class VideoWorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_shared<CallLog>();
    state_.Mutate([](state::PlaybackState& s) {
      s.active_source_kind = state::SourceKind::kVideo;
    });
  }

  void TearDown() override { worker_.reset(); }

  void Build(int items, bool supports_pause = true) {
    auto source = std::make_unique<FakeVideoSource>(FakeVideoSource::MakeItems(items));
    source_ = source.get();
    auto launcher = std::make_unique<FakePlayerLauncher>("video", log_, supports_pause);
    launcher_ = launcher.get();

    VideoWorkerOptions options;
    options.max_videos = 50;
    options.timing = runtime::WorkerTiming{milliseconds(20), milliseconds(2000), 64};
    options.terminate_grace = milliseconds(10);
    options.barrier_timeout = milliseconds(500);
    worker_ = std::make_unique<VideoWorker>(std::move(source), std::move(launcher), store_,
                                            state_, options);
    worker_->Start();
  }

  std::shared_ptr<CallLog> log_;
  InMemoryStateStore store_;
  state::SharedPlaybackState state_;
  FakeVideoSource* source_ = nullptr;
  FakePlayerLauncher* launcher_ = nullptr;
  std::unique_ptr<VideoWorker> worker_;
};

TEST_F(VideoWorkerTest, PlaysFirstUnwatchedItemAndRecordsIt) {
  Build(3);
  worker_->PlayChannel(kChannel);

  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));
  EXPECT_EQ(store_.Watched().count("v0"), 1u);
  ASSERT_TRUE(WaitUntil([&] { return state_.GetSnapshot().current_track.has_value(); }));
  const auto snapshot = state_.GetSnapshot();
  EXPECT_TRUE(snapshot.is_playing);
  EXPECT_EQ(snapshot.current_track->title, "Video 0");
  EXPECT_EQ(snapshot.current_track->artist, VideoWorker::kTrackArtist);
}

TEST_F(VideoWorkerTest, SkipsItemsWatchedInEarlierSessions) {
  store_.SeedWatched({"v0", "v1"});
  Build(4);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v2"), 1, milliseconds(2000)));
  EXPECT_EQ(log_->Count(Spawn("v0")), 0u);
}

TEST_F(VideoWorkerTest, AllWatchedLoopsBackToFirstItem) {
  store_.SeedWatched({"v0", "v1", "v2"});
  Build(3);
  worker_->PlayChannel(kChannel);
  EXPECT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));
}

TEST_F(VideoWorkerTest, UnresolvableItemIsMarkedWatchedAndSkipped) {
  Build(4);
  source_->MarkUnavailable("v0");
  source_->MarkUnavailable("v1");
  worker_->PlayChannel(kChannel);

  ASSERT_TRUE(log_->WaitForCount(Spawn("v2"), 1, milliseconds(2000)));
  EXPECT_EQ(store_.Watched().count("v0"), 1u);
  EXPECT_EQ(store_.Watched().count("v1"), 1u);
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
}

TEST_F(VideoWorkerTest, FailedLastUnwatchedItemFallsThroughToPlayableWatchedItem) {
  store_.SeedWatched({"v1", "v2"});
  Build(3);
  source_->MarkUnavailable("v0");
  source_->MarkUnavailable("v1");
  worker_->PlayChannel(kChannel);

  ASSERT_TRUE(log_->WaitForCount(Spawn("v2"), 1, milliseconds(2000)));
  const auto resolved = source_->Resolved();
  ASSERT_EQ(resolved.size(), 3u);
  EXPECT_EQ(resolved[0], "https://video.test/watch?v=v0");
  EXPECT_EQ(resolved[1], "https://video.test/watch?v=v1");
  EXPECT_EQ(resolved[2], "https://video.test/watch?v=v2");
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
}

TEST_F(VideoWorkerTest, NothingPlayableIsBoundedAndWorkerStaysResponsive) {
  Build(3);
  for (const char* id : {"v0", "v1", "v2"}) source_->MarkUnavailable(id);
  worker_->PlayChannel(kChannel);

  auto done = std::make_shared<runtime::Completion>();
  worker_->Stop(done);
  ASSERT_TRUE(done->WaitFor(milliseconds(2000)));
  EXPECT_EQ(source_->Resolved().size(), 3u);
  EXPECT_EQ(launcher_->SpawnCount(), 0u);
  EXPECT_FALSE(state_.GetSnapshot().is_playing);
}

TEST_F(VideoWorkerTest, FinishedProcessAutoAdvances) {
  Build(3);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));

  launcher_->Latest()->Finish(0);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v1"), 1, milliseconds(2000)));
  EXPECT_TRUE(WaitUntil([&] {
    auto s = state_.GetSnapshot();
    return s.current_track && s.current_track->title == "Video 1";
  }));
}

TEST_F(VideoWorkerTest, NextStopsCurrentBeforeStartingNext) {
  Build(3);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));

  worker_->Next();
  ASSERT_TRUE(log_->WaitForCount(Spawn("v1"), 1, milliseconds(2000)));
  EXPECT_LT(log_->IndexOf(Stop("v0")), log_->IndexOf(Spawn("v1")));
  EXPECT_EQ(launcher_->RunningCount(), 1u);
}

TEST_F(VideoWorkerTest, PreviousReplaysPriorItem) {
  Build(3);
  worker_->PlayChannel(kChannel);
  worker_->Next();
  ASSERT_TRUE(log_->WaitForCount(Spawn("v1"), 1, milliseconds(2000)));

  worker_->Previous();
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 2, milliseconds(2000)));
  EXPECT_LT(log_->IndexOf(Stop("v1")), log_->IndexOf(Spawn("v0"), 1));
}

TEST_F(VideoWorkerTest, PauseAndResumeInPlace) {
  Build(2);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));

  worker_->Pause();
  ASSERT_TRUE(log_->WaitForCount("video:pause:" + FakeVideoSource::StreamFor("v0"), 1,
                                 milliseconds(2000)));
  EXPECT_TRUE(WaitUntil([&] { return !state_.GetSnapshot().is_playing; }));

  worker_->Resume();
  ASSERT_TRUE(log_->WaitForCount("video:resume:" + FakeVideoSource::StreamFor("v0"), 1,
                                 milliseconds(2000)));
  EXPECT_TRUE(WaitUntil([&] { return state_.GetSnapshot().is_playing; }));
  EXPECT_EQ(launcher_->SpawnCount(), 1u);
}

TEST_F(VideoWorkerTest, PauseWithoutControlChannelStopsAndResumeReplays) {
  Build(2, /*supports_pause=*/false);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));

  worker_->Pause();
  ASSERT_TRUE(log_->WaitForCount(Stop("v0"), 1, milliseconds(2000)));
  worker_->Resume();
  EXPECT_TRUE(log_->WaitForCount(Spawn("v0"), 2, milliseconds(2000)));
}

TEST_F(VideoWorkerTest, StopSignalsCompletionAndEndsProcess) {
  Build(2);
  worker_->PlayChannel(kChannel);
  ASSERT_TRUE(log_->WaitForCount(Spawn("v0"), 1, milliseconds(2000)));

  auto done = std::make_shared<runtime::Completion>();
  worker_->Stop(done);
  ASSERT_TRUE(done->WaitFor(milliseconds(2000)));
  EXPECT_EQ(launcher_->RunningCount(), 0u);
}

TEST_F(VideoWorkerTest, MissingPlayerDisablesVideoWithOneWarning) {
  auto warnings = std::make_shared<CallLog>();
  util::Logger::SetWarnSink([warnings](const std::string& line) {
    if (line.find("video playback disabled") != std::string::npos) warnings->Append(line);
  });

  Build(2);
  launcher_->missing_binary = true;
  worker_->PlayChannel(kChannel);
  worker_->PlayChannel(kChannel);
  worker_->Next();
  auto done = std::make_shared<runtime::Completion>();
  worker_->Stop(done);
  ASSERT_TRUE(done->WaitFor(milliseconds(2000)));
  util::Logger::SetWarnSink(nullptr);

  EXPECT_EQ(warnings->Entries().size(), 1u);
  EXPECT_EQ(source_->ListCalls(), 1);
}

TEST_F(VideoWorkerTest, CommandsRunInEnqueueOrder) {
  Build(5);
  worker_->PlayChannel(kChannel);
  worker_->Next();
  worker_->Next();
  worker_->Previous();

  ASSERT_TRUE(log_->WaitForCount(Spawn("v1"), 2, milliseconds(2000)));
  EXPECT_LT(log_->IndexOf(Spawn("v0")), log_->IndexOf(Spawn("v1")));
  EXPECT_LT(log_->IndexOf(Spawn("v1")), log_->IndexOf(Spawn("v2")));
  EXPECT_LT(log_->IndexOf(Spawn("v2")), log_->IndexOf(Spawn("v1"), 1));
}

}  // namespace
}  // namespace jukebox::workers
