// Repository: Jukebox-controller
// Component: Command queue unit tests
// Purpose: FIFO order, drop-newest saturation and non-blocking enqueue.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "jukebox/runtime/CommandQueue.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::runtime {
namespace {

TEST(CommandQueueTest, DequeuesInEnqueueOrder) {
  CommandQueue<int> queue("fifo", 16);
  for (int i = 0; i < 10; ++i) ASSERT_TRUE(queue.TryEnqueue(i));

  for (int i = 0; i < 10; ++i) {
    auto value = queue.WaitDequeue(std::chrono::milliseconds(10));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
  EXPECT_FALSE(queue.WaitDequeue(std::chrono::milliseconds(10)).has_value());
}

TEST(CommandQueueTest, FullQueueDropsNewestAndWarns) {
  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&warnings](const std::string& line) { warnings.push_back(line); });

  CommandQueue<int> queue("saturated", 3);
  EXPECT_TRUE(queue.TryEnqueue(1));
  EXPECT_TRUE(queue.TryEnqueue(2));
  EXPECT_TRUE(queue.TryEnqueue(3));
  EXPECT_FALSE(queue.TryEnqueue(4));
  EXPECT_FALSE(queue.TryEnqueue(5));
  util::Logger::SetWarnSink(nullptr);

  EXPECT_EQ(queue.Size(), 3u);
  EXPECT_EQ(queue.DroppedCount(), 2u);
  ASSERT_EQ(warnings.size(), 2u);
  EXPECT_NE(warnings[0].find("saturated"), std::string::npos);

  // The oldest commands survive.
  EXPECT_EQ(*queue.WaitDequeue(std::chrono::milliseconds(0)), 1);
  EXPECT_EQ(*queue.WaitDequeue(std::chrono::milliseconds(0)), 2);
  EXPECT_EQ(*queue.WaitDequeue(std::chrono::milliseconds(0)), 3);
}

TEST(CommandQueueTest, EnqueueNeverBlocksWhenSaturated) {
  CommandQueue<int> queue("nobody-drains", 4);
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 10000; ++i) queue.TryEnqueue(i);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(queue.Size(), 4u);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(CommandQueueTest, ControlCommandBypassesCapacity) {
  CommandQueue<int> queue("control", 1);
  ASSERT_TRUE(queue.TryEnqueue(1));
  queue.PushControl(-1);
  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(*queue.WaitDequeue(std::chrono::milliseconds(0)), 1);
  EXPECT_EQ(*queue.WaitDequeue(std::chrono::milliseconds(0)), -1);
}

TEST(CommandQueueTest, WaitDequeueWakesOnEnqueue) {
  CommandQueue<int> queue("wake", 4);
  std::thread producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    queue.TryEnqueue(7);
  });
  auto value = queue.WaitDequeue(std::chrono::seconds(5));
  producer.join();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
}

}  // namespace
}  // namespace jukebox::runtime
