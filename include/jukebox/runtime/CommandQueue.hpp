// Repository: Jukebox-controller
// Component: Command Queue
// Purpose: Bounded FIFO between a caller thread and one worker thread.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_COMMAND_QUEUE_HPP_
#define JUKEBOX_RUNTIME_COMMAND_QUEUE_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "jukebox/util/Logger.hpp"

namespace jukebox::runtime {

// CommandQueue is the fire-and-forget control plane of a worker.
//
// TryEnqueue never blocks on the consumer: the lock is only held for the
// push itself. When the queue is at capacity the NEWEST command (the one being
// offered) is dropped and a warning is logged; the caller may ignore the
// return value.
//
// PushControl ignores the capacity bound. It exists for Shutdown so a
// saturated queue can still be stopped in FIFO order behind pending work.
template <typename Command>
class CommandQueue {
 public:
  static constexpr size_t kDefaultCapacity = 64;

  explicit CommandQueue(std::string name, size_t capacity = kDefaultCapacity)
      : name_(std::move(name)), capacity_(capacity == 0 ? 1 : capacity) {}

  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  // Returns false when the command was dropped.
  bool TryEnqueue(Command command) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.size() >= capacity_) {
        ++dropped_;
      } else {
        items_.push_back(std::move(command));
        cv_.notify_one();
        return true;
      }
    }
    util::Logger::Warn("[" + name_ + "] command queue full (capacity " +
                       std::to_string(capacity_) + "), dropping newest command");
    return false;
  }

  void PushControl(Command command) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(command));
    cv_.notify_one();
  }

  // Waits up to `timeout` for a command. Returns std::nullopt on timeout.
  template <typename Rep, typename Period>
  std::optional<Command> WaitDequeue(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    Command command = std::move(items_.front());
    items_.pop_front();
    return command;
  }

  // Removes every queued command matching `pred`. Returns how many went.
  template <typename Pred>
  size_t RemoveIf(Pred pred) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(), pred), items_.end());
    return before - items_.size();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

  uint64_t DroppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

 private:
  const std::string name_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Command> items_;
  uint64_t dropped_ = 0;
};

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_COMMAND_QUEUE_HPP_
