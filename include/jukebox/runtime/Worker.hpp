// Repository: Jukebox-controller
// Component: Worker Base
// Purpose: Thread, command queue and poll cadence shared by every backend worker.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_WORKER_HPP_
#define JUKEBOX_RUNTIME_WORKER_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include "jukebox/runtime/CommandQueue.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::runtime {

// Every worker command variant carries this alternative. It travels through
// the same queue as other work, so everything queued before it still runs.
struct ShutdownCommand {};

struct WorkerTiming {
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds join_timeout{5000};
  size_t queue_capacity = 64;
};

// Worker<Command> owns one thread that
//   1. waits on the command queue until the next poll deadline,
//   2. handles at most one command,
//   3. polls backend status once the deadline has passed.
// There is no fixed sleep; an idle worker blocks in the queue wait.
//
// Command must be a std::variant with a ShutdownCommand alternative.
//
// Derived classes must call JoinOnDestruction() from their own
// destructor: the thread calls virtual hooks, so it has to be gone before the
// derived part is destroyed.
template <typename Command>
class Worker {
 public:
  Worker(std::string name, WorkerTiming timing)
      : name_(std::move(name)),
        timing_(timing),
        queue_(name_, timing.queue_capacity) {}

  virtual ~Worker() { JoinOnDestruction(); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (thread_.joinable()) return;
    {
      std::lock_guard<std::mutex> done_lock(done_mutex_);
      finished_ = false;
    }
    shutdown_pending_.store(false, std::memory_order_release);
    // A previous run may have left without consuming its ShutdownCommand
    // (PrepareIteration() kept failing until the stop request).
    queue_.RemoveIf([](const Command& c) { return std::holds_alternative<ShutdownCommand>(c); });
    thread_ = std::thread([this] { Run(); });
    started_.store(true, std::memory_order_release);
    util::Logger::Info("[" + name_ + "] started");
  }

  // Queues ShutdownCommand behind pending commands and waits up to the join
  // timeout. Returns false (and logs) if the thread did not finish in time;
  // the final join then happens on destruction.
  bool StopThread() { return StopThread(timing_.join_timeout); }

  bool StopThread(std::chrono::milliseconds join_timeout) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!thread_.joinable()) return true;

    RequestShutdown();

    std::unique_lock<std::mutex> done_lock(done_mutex_);
    if (!done_cv_.wait_for(done_lock, join_timeout, [this] { return finished_; })) {
      util::Logger::Warn("[" + name_ + "] did not stop within " +
                         std::to_string(join_timeout.count()) + "ms");
      return false;
    }
    done_lock.unlock();
    thread_.join();
    util::Logger::Info("[" + name_ + "] stopped");
    return true;
  }

  // True once Start() has been called at least once.
  bool HasStarted() const { return started_.load(std::memory_order_acquire); }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(done_mutex_);
    return started_.load(std::memory_order_acquire) && !finished_;
  }

  const std::string& Name() const { return name_; }

  size_t DroppedCommandCount() const { return queue_.DroppedCount(); }

 protected:
  bool Enqueue(Command command) { return queue_.TryEnqueue(std::move(command)); }

  virtual void HandleCommand(Command& command) = 0;

  // Called when the poll deadline has passed.
  virtual void Poll() {}

  // Called at the top of every iteration. Returning false skips the queue
  // and the poll for this iteration (e.g. not connected yet).
  virtual bool PrepareIteration() { return true; }

  // Runs on the worker thread after the loop exits.
  virtual void OnStopped() {}

  // Sleeps for `duration` unless StopThread() is called meanwhile.
  // Returns false when woken by StopThread().
  bool SleepUnlessStopping(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return !wake_cv_.wait_for(lock, duration, [this] {
      return shutdown_pending_.load(std::memory_order_acquire);
    });
  }

  bool ShutdownPending() const {
    return shutdown_pending_.load(std::memory_order_acquire);
  }

  void JoinOnDestruction() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!thread_.joinable()) return;
    RequestShutdown();
    thread_.join();
  }

  const WorkerTiming& Timing() const { return timing_; }

 private:
  void RequestShutdown() {
    {
      std::lock_guard<std::mutex> wake_lock(wake_mutex_);
      shutdown_pending_.store(true, std::memory_order_release);
    }
    queue_.PushControl(Command{ShutdownCommand{}});
    wake_cv_.notify_all();
  }

  void Run() {
    using Clock = std::chrono::steady_clock;
    Clock::time_point next_poll = Clock::now() + timing_.poll_interval;

    for (;;) {
      if (!PrepareIteration()) {
        // A worker that cannot serve commands still has to honour StopThread().
        if (ShutdownPending()) break;
        continue;
      }

      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
          next_poll - Clock::now());
      wait = std::max(wait, std::chrono::milliseconds(0));

      if (auto command = queue_.WaitDequeue(wait)) {
        if (std::holds_alternative<ShutdownCommand>(*command)) break;
        HandleCommand(*command);
      }

      if (Clock::now() >= next_poll) {
        Poll();
        next_poll = Clock::now() + timing_.poll_interval;
      }
    }

    OnStopped();
    {
      std::lock_guard<std::mutex> lock(done_mutex_);
      finished_ = true;
    }
    done_cv_.notify_all();
  }

  const std::string name_;
  const WorkerTiming timing_;
  CommandQueue<Command> queue_;

  std::mutex lifecycle_mutex_;
  std::thread thread_;
  std::atomic<bool> started_{false};
  std::atomic<bool> shutdown_pending_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  mutable std::mutex done_mutex_;
  std::condition_variable done_cv_;
  bool finished_ = false;
};

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_WORKER_HPP_
