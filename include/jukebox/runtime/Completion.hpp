// Repository: Jukebox-controller
// Component: Completion
// Purpose: One-shot latch used to order work across two worker threads.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_COMPLETION_HPP_
#define JUKEBOX_RUNTIME_COMPLETION_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace jukebox::runtime {

class Completion {
 public:
  void Signal() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
  }

  bool IsDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
  }

  // Returns false if the latch was not signalled within `timeout`.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return done_; });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool done_ = false;
};

using CompletionPtr = std::shared_ptr<Completion>;

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_COMPLETION_HPP_
