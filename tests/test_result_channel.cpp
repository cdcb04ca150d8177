// Repository: Jukebox-controller
// Component: Result channel unit tests
// Purpose: Per-ticket reply delivery, late replies and cancellation.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

#include "jukebox/runtime/ResultChannel.hpp"

namespace jukebox::runtime {
namespace {

using std::chrono::milliseconds;

TEST(ResultChannelTest, DeliversReplyToItsOwnTicket) {
  ResultChannel<int> channel;
  const uint64_t ticket = channel.NextTicket();
  channel.Publish(ticket, 7);
  EXPECT_EQ(channel.WaitFor(ticket, milliseconds(100)), std::optional<int>(7));
  EXPECT_EQ(channel.PendingCount(), 0u);
}

TEST(ResultChannelTest, BackToBackRepliesReachBothWaiters) {
  for (int round = 0; round < 200; ++round) {
    ResultChannel<int> channel;
    const uint64_t first = channel.NextTicket();
    const uint64_t second = channel.NextTicket();
    std::atomic<bool> waiting{false};
    std::optional<int> first_reply;
    std::thread waiter([&] {
      waiting = true;
      first_reply = channel.WaitFor(first, milliseconds(1000));
    });
    while (!waiting) std::this_thread::yield();

    channel.Publish(first, 1);
    channel.Publish(second, 2);
    waiter.join();

    ASSERT_EQ(first_reply, std::optional<int>(1)) << "round " << round;
    EXPECT_EQ(channel.WaitFor(second, milliseconds(100)), std::optional<int>(2));
  }
}

TEST(ResultChannelTest, ReplyAfterTimeoutIsDropped) {
  ResultChannel<int> channel;
  const uint64_t stale = channel.NextTicket();
  EXPECT_FALSE(channel.WaitFor(stale, milliseconds(20)).has_value());
  channel.Publish(stale, 1);
  EXPECT_EQ(channel.PendingCount(), 0u);

  const uint64_t fresh = channel.NextTicket();
  channel.Publish(fresh, 2);
  EXPECT_EQ(channel.WaitFor(fresh, milliseconds(100)), std::optional<int>(2));
}

TEST(ResultChannelTest, CancelReleasesUnsentTicket) {
  ResultChannel<bool> channel;
  const uint64_t ticket = channel.NextTicket();
  EXPECT_EQ(channel.PendingCount(), 1u);
  channel.Cancel(ticket);
  EXPECT_EQ(channel.PendingCount(), 0u);
  channel.Publish(ticket, true);
  EXPECT_FALSE(channel.WaitFor(ticket, milliseconds(10)).has_value());
}

}  // namespace
}  // namespace jukebox::runtime
