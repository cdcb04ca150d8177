// Repository: Jukebox-controller
// Component: Debounced Index Writer
// Purpose: Coalesces rapid index changes into one delayed write on a dedicated thread.
// Copyright (c) 2026 Jukebox

#include "jukebox/sources/DebouncedIndexWriter.hpp"

#include "jukebox/util/Logger.hpp"

namespace jukebox::sources {

DebouncedIndexWriter::DebouncedIndexWriter(WriteFn write, std::chrono::milliseconds window)
    : write_(std::move(write)), window_(window) {
  writer_thread_ = std::thread([this] { WriterLoop(); });
}

DebouncedIndexWriter::~DebouncedIndexWriter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
}

void DebouncedIndexWriter::Schedule(int value) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool armed = pending_.has_value();
    pending_ = value;
    if (armed) return;
    deadline_ = std::chrono::steady_clock::now() + window_;
  }
  cv_.notify_all();
}

void DebouncedIndexWriter::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  WriteLocked(lock);
}

bool DebouncedIndexWriter::HasPending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.has_value();
}

void DebouncedIndexWriter::WriterLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!shutdown_) {
    if (!pending_) {
      cv_.wait(lock, [this] { return shutdown_ || pending_.has_value(); });
      continue;
    }
    const auto deadline = deadline_;
    cv_.wait_until(lock, deadline, [this] { return shutdown_ || !pending_.has_value(); });
    if (shutdown_) break;
    if (pending_ && std::chrono::steady_clock::now() >= deadline_) {
      WriteLocked(lock);
    }
  }
  // Final flush on shutdown.
  WriteLocked(lock);
}

void DebouncedIndexWriter::WriteLocked(std::unique_lock<std::mutex>& lock) {
  // One write in flight at a time, so values reach the store in order.
  cv_.wait(lock, [this] { return !writing_; });
  if (!pending_) return;
  const int value = *pending_;
  pending_.reset();
  writing_ = true;
  // Write outside the lock so Schedule() never waits on disk I/O.
  lock.unlock();
  const bool ok = write_(value);
  lock.lock();
  writing_ = false;
  cv_.notify_all();
  if (!ok) {
    util::Logger::Error("[DebouncedIndexWriter] failed to persist index " + std::to_string(value));
  }
}

}  // namespace jukebox::sources
