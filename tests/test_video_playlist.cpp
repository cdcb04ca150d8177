// Repository: Jukebox-controller
// Component: Video playlist unit tests
// Purpose: Unwatched selection, the loop-around law and index wrapping.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "fixtures/FakeVideoSource.h"
#include "jukebox/workers/VideoPlaylist.hpp"

namespace jukebox::workers {
namespace {

using tests::fixtures::FakeVideoSource;

TEST(VideoPlaylistTest, NothingWatchedSelectsIndexZero) {
  VideoPlaylist playlist;
  playlist.Reset(FakeVideoSource::MakeItems(5));
  bool looped = true;
  const auto* item = playlist.SelectNextUnwatched({}, &looped);
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->id, "v0");
  EXPECT_EQ(playlist.Index(), 0u);
  EXPECT_FALSE(looped);
}

TEST(VideoPlaylistTest, SkipsWatchedScanningForwardCircularly) {
  VideoPlaylist playlist;
  playlist.Reset(FakeVideoSource::MakeItems(5));
  playlist.Advance(3);

  const std::set<std::string> watched{"v3", "v4"};
  const auto* item = playlist.SelectNextUnwatched(watched);
  ASSERT_NE(item, nullptr);
  EXPECT_EQ(item->id, "v0");
  EXPECT_EQ(playlist.Index(), 0u);
}

TEST(VideoPlaylistTest, AllWatchedLoopsBackToFirstItem) {
  VideoPlaylist playlist;
  playlist.Reset(FakeVideoSource::MakeItems(4));
  playlist.Advance(2);

  const std::set<std::string> watched{"v0", "v1", "v2", "v3"};
  bool looped = false;
  const auto* item = playlist.SelectNextUnwatched(watched, &looped);
  ASSERT_NE(item, nullptr);
  EXPECT_TRUE(looped);
  EXPECT_EQ(item->id, "v0");
  EXPECT_EQ(playlist.Index(), 0u);
}

TEST(VideoPlaylistTest, AdvanceWrapsBothWays) {
  VideoPlaylist playlist;
  playlist.Reset(FakeVideoSource::MakeItems(3));
  playlist.Advance(-1);
  EXPECT_EQ(playlist.Index(), 2u);
  playlist.Advance(2);
  EXPECT_EQ(playlist.Index(), 1u);
}

TEST(VideoPlaylistTest, EmptyPlaylistSelectsNothing) {
  VideoPlaylist playlist;
  EXPECT_EQ(playlist.SelectNextUnwatched({}), nullptr);
  EXPECT_EQ(playlist.Current(), nullptr);
  playlist.Advance(1);
  EXPECT_TRUE(playlist.Empty());
}

}  // namespace
}  // namespace jukebox::workers
