// Repository: Jukebox-controller
// Component: Subprocess unit tests
// Purpose: Capture, exit codes, missing binaries and forking from busy threads.
// Copyright (c) 2026 Jukebox

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/backends/Subprocess.hpp"

namespace jukebox::backends {
namespace {

using std::chrono::milliseconds;

TEST(SubprocessTest, CapturesStdoutStderrAndExitCode) {
  CaptureResult r = RunAndCapture({"/bin/sh", "-c", "cat; echo oops >&2; exit 3"},
                                  "hello from stdin", milliseconds(5000));
  EXPECT_FALSE(r.timed_out);
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.stdout_text, "hello from stdin");
  EXPECT_EQ(r.stderr_text, "oops\n");
}

TEST(SubprocessTest, MissingBinaryIsResourceUnavailable) {
  EXPECT_THROW(RunAndCapture({"jukebox-no-such-binary"}, "", milliseconds(1000)),
               ResourceUnavailable);
  EXPECT_THROW(ProcessHandle::Spawn({"jukebox-no-such-binary"}), ResourceUnavailable);
}

TEST(SubprocessTest, TimeoutKillsChild) {
  CaptureResult r = RunAndCapture({"/bin/sh", "-c", "sleep 5"}, "", milliseconds(100));
  EXPECT_TRUE(r.timed_out);
}

TEST(SubprocessTest, SpawnedProcessIsStoppedAndReaped) {
  ProcessHandle handle = ProcessHandle::Spawn({"/bin/sh", "-c", "sleep 5"});
  ASSERT_TRUE(handle.Valid());
  EXPECT_FALSE(handle.Poll().has_value());
  handle.Stop(milliseconds(200));
  EXPECT_TRUE(handle.Poll().has_value());
}

// Children are forked while sibling threads hammer the allocator; the
// child must not need the heap between fork and exec.
TEST(SubprocessTest, ForkWhileOtherThreadsAllocate) {
  std::atomic<bool> done{false};
  std::vector<std::thread> churners;
  for (int i = 0; i < 4; ++i) {
    churners.emplace_back([&done] {
      while (!done) {
        std::vector<std::unique_ptr<std::string>> garbage;
        for (int k = 0; k < 64; ++k) {
          garbage.push_back(std::make_unique<std::string>(256, 'x'));
        }
      }
    });
  }

  std::vector<std::thread> runners;
  std::atomic<int> ok{0};
  for (int i = 0; i < 4; ++i) {
    runners.emplace_back([&ok] {
      for (int k = 0; k < 25; ++k) {
        CaptureResult r = RunAndCapture({"/bin/echo", "ran"}, "", milliseconds(5000));
        if (!r.timed_out && r.exit_code == 0 && r.stdout_text == "ran\n") ok.fetch_add(1);
      }
    });
  }
  for (auto& t : runners) t.join();
  done = true;
  for (auto& t : churners) t.join();

  EXPECT_EQ(ok.load(), 100);
}

}  // namespace
}  // namespace jukebox::backends
