// Repository: Jukebox-controller
// Component: Result Channel
// Purpose: One-shot replies from a worker thread to a caller waiting with a timeout.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_RUNTIME_RESULT_CHANNEL_HPP_
#define JUKEBOX_RUNTIME_RESULT_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>

namespace jukebox::runtime {

// ResultChannel pairs every synchronous request with a ticket. The caller
// takes a ticket with NextTicket(), sends it inside the command, and waits
// with WaitFor(ticket, timeout). The worker answers with Publish(ticket, v).
//
// Each outstanding ticket owns its own reply slot, so concurrent callers never
// see each other's replies. WaitFor releases the slot whether or not a reply
// arrived; a reply published after that (the caller already gave up) is
// dropped.
template <typename T>
class ResultChannel {
 public:
  ResultChannel() = default;
  ResultChannel(const ResultChannel&) = delete;
  ResultChannel& operator=(const ResultChannel&) = delete;

  uint64_t NextTicket() {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t ticket = ++last_ticket_;
    pending_.emplace(ticket, std::nullopt);
    return ticket;
  }

  // Releases a ticket whose request was never sent.
  void Cancel(uint64_t ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(ticket);
  }

  void Publish(uint64_t ticket, T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(ticket);
      if (it == pending_.end()) return;
      it->second = std::move(value);
    }
    cv_.notify_all();
  }

  template <typename Rep, typename Period>
  std::optional<T> WaitFor(uint64_t ticket, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] {
      auto it = pending_.find(ticket);
      return it == pending_.end() || it->second.has_value();
    });
    auto it = pending_.find(ticket);
    if (it == pending_.end()) return std::nullopt;
    std::optional<T> out = std::move(it->second);
    pending_.erase(it);
    return out;
  }

  size_t PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t last_ticket_ = 0;
  std::map<uint64_t, std::optional<T>> pending_;
};

}  // namespace jukebox::runtime

#endif  // JUKEBOX_RUNTIME_RESULT_CHANNEL_HPP_
