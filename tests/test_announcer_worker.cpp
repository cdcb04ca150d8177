// Repository: Jukebox-controller
// Component: Announcer worker unit tests
// Purpose: Interrupt-and-replace playback, caching and failure handling.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "fixtures/CallLog.h"
#include "fixtures/FakePlayerLauncher.h"
#include "fixtures/FakeSpeechBackends.h"
#include "jukebox/media/AnnouncementCache.hpp"
#include "jukebox/util/Logger.hpp"
#include "jukebox/workers/AnnouncerWorker.hpp"

namespace jukebox::workers {
namespace {

using std::chrono::milliseconds;
using tests::fixtures::CallLog;
using tests::fixtures::FakeMediaProbe;
using tests::fixtures::FakePlayerLauncher;
using tests::fixtures::FakeSpeechSynthesizer;
using tests::fixtures::WaitUntil;

std::string MakeCacheDir() {
  static std::atomic<int> counter{0};
  return "/tmp/jukebox_announcer_test_" + std::to_string(getpid()) + "_" +
         std::to_string(counter.fetch_add(1));
}

class RecordingListener : public IAnnouncementListener {
 public:
  explicit RecordingListener(std::shared_ptr<CallLog> log) : log_(std::move(log)) {}
  void OnAnnouncementStarted() override { log_->Append("listener:started"); }
  void OnAnnouncementFinished() override { log_->Append("listener:finished"); }

 private:
  std::shared_ptr<CallLog> log_;
};

class AnnouncerWorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    log_ = std::make_shared<CallLog>();
    listener_ = std::make_unique<RecordingListener>(log_);
    cache_dir_ = MakeCacheDir();

    auto synth = std::make_unique<FakeSpeechSynthesizer>();
    synth_ = synth.get();
    auto launcher = std::make_unique<FakePlayerLauncher>("announce", log_);
    launcher_ = launcher.get();
    auto probe = std::make_unique<FakeMediaProbe>();
    probe_ = probe.get();

    AnnouncerWorkerOptions options;
    options.timing = runtime::WorkerTiming{milliseconds(20), milliseconds(2000), 64};
    options.terminate_grace = milliseconds(10);
    worker_ = std::make_unique<AnnouncerWorker>(std::move(synth), std::move(launcher),
                                                std::move(probe),
                                                media::AnnouncementCache(cache_dir_),
                                                listener_.get(), options);
    worker_->Start();
  }

  void TearDown() override { worker_.reset(); }

  std::string SpawnOf(const std::string& text) const {
    return "announce:spawn:" + media::AnnouncementCache(cache_dir_).PathFor(text);
  }
  std::string StopOf(const std::string& text) const {
    return "announce:stop:" + media::AnnouncementCache(cache_dir_).PathFor(text);
  }

  std::shared_ptr<CallLog> log_;
  std::unique_ptr<RecordingListener> listener_;
  std::string cache_dir_;
  FakeSpeechSynthesizer* synth_ = nullptr;
  FakePlayerLauncher* launcher_ = nullptr;
  FakeMediaProbe* probe_ = nullptr;
  std::unique_ptr<AnnouncerWorker> worker_;
};

TEST_F(AnnouncerWorkerTest, SecondAnnouncementReplacesFirst) {
  worker_->Announce("music, Morning Mix");
  worker_->Announce("news, Evening News");

  ASSERT_TRUE(log_->WaitForCount(SpawnOf("news, Evening News"), 1, milliseconds(2000)));
  const int spawn_a = log_->IndexOf(SpawnOf("music, Morning Mix"));
  const int stop_a = log_->IndexOf(StopOf("music, Morning Mix"));
  const int spawn_b = log_->IndexOf(SpawnOf("news, Evening News"));
  ASSERT_GE(spawn_a, 0);
  EXPECT_LT(spawn_a, stop_a);
  EXPECT_LT(stop_a, spawn_b);
  EXPECT_EQ(launcher_->RunningCount(), 1u);
  EXPECT_EQ(launcher_->Latest()->target,
            media::AnnouncementCache(cache_dir_).PathFor("news, Evening News"));

  // Replacement is one continuous announcement for the listener.
  EXPECT_EQ(log_->Count("listener:started"), 1u);
  EXPECT_EQ(log_->Count("listener:finished"), 0u);
}

TEST_F(AnnouncerWorkerTest, FinishedPlaybackNotifiesListenerOnce) {
  worker_->Announce("hello");
  ASSERT_TRUE(log_->WaitForCount(SpawnOf("hello"), 1, milliseconds(2000)));
  launcher_->Latest()->Finish(0);
  ASSERT_TRUE(log_->WaitForCount("listener:finished", 1, milliseconds(2000)));
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_EQ(log_->Count("listener:finished"), 1u);
  EXPECT_LT(log_->IndexOf("listener:started"), log_->IndexOf("listener:finished"));
}

TEST_F(AnnouncerWorkerTest, RepeatedTextUsesCachedArtifact) {
  worker_->Announce("same words");
  ASSERT_TRUE(log_->WaitForCount(SpawnOf("same words"), 1, milliseconds(2000)));
  worker_->Announce("same words");
  ASSERT_TRUE(log_->WaitForCount(SpawnOf("same words"), 2, milliseconds(2000)));

  EXPECT_EQ(synth_->Texts().size(), 1u);
  EXPECT_TRUE(media::AnnouncementCache(cache_dir_).Contains("same words"));
}

TEST_F(AnnouncerWorkerTest, SynthesisFailurePlaysNothingAndRecovers) {
  synth_->fail = true;
  worker_->Announce("broken");
  ASSERT_TRUE(WaitUntil([&] { return synth_->Texts().size() == 1; }));
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(launcher_->SpawnCount(), 0u);
  EXPECT_FALSE(media::AnnouncementCache(cache_dir_).Contains("broken"));
  EXPECT_FALSE(worker_->IsDisabled());

  synth_->fail = false;
  worker_->Announce("working");
  EXPECT_TRUE(log_->WaitForCount(SpawnOf("working"), 1, milliseconds(2000)));
}

TEST_F(AnnouncerWorkerTest, UnplayableArtifactIsEvicted) {
  probe_->reject = true;
  worker_->Announce("garbled");
  ASSERT_TRUE(WaitUntil([&] { return synth_->Texts().size() == 1; }));
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_EQ(launcher_->SpawnCount(), 0u);
  EXPECT_FALSE(media::AnnouncementCache(cache_dir_).Contains("garbled"));
}

TEST_F(AnnouncerWorkerTest, MissingVoiceModelDisablesWithOneWarning) {
  auto warnings = std::make_shared<CallLog>();
  util::Logger::SetWarnSink([warnings](const std::string& line) {
    if (line.find("announcements disabled") != std::string::npos) warnings->Append(line);
  });

  synth_->missing_model = true;
  worker_->Announce("first");
  worker_->Announce("second");
  worker_->Announce("third");
  ASSERT_TRUE(WaitUntil([&] { return worker_->IsDisabled(); }));
  worker_->StopThread();
  util::Logger::SetWarnSink(nullptr);

  EXPECT_EQ(warnings->Entries().size(), 1u);
  EXPECT_EQ(launcher_->SpawnCount(), 0u);
}

TEST_F(AnnouncerWorkerTest, BlankTextIsRejected) {
  worker_->Announce("   ");
  worker_->Announce("");
  std::this_thread::sleep_for(milliseconds(100));
  EXPECT_TRUE(synth_->Texts().empty());
  EXPECT_EQ(launcher_->SpawnCount(), 0u);
}

TEST_F(AnnouncerWorkerTest, ShutdownStopsPlayingAnnouncement) {
  worker_->Announce("long announcement");
  ASSERT_TRUE(log_->WaitForCount(SpawnOf("long announcement"), 1, milliseconds(2000)));
  EXPECT_TRUE(worker_->StopThread());
  EXPECT_EQ(launcher_->RunningCount(), 0u);
  EXPECT_EQ(log_->Count("listener:finished"), 1u);
}

}  // namespace
}  // namespace jukebox::workers
