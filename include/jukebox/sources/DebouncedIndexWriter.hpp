// Repository: Jukebox-controller
// Component: Debounced Index Writer
// Purpose: Coalesces rapid index changes into one delayed write on a dedicated thread.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_SOURCES_DEBOUNCED_INDEX_WRITER_HPP_
#define JUKEBOX_SOURCES_DEBOUNCED_INDEX_WRITER_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace jukebox::sources {

// Schedule(v) records v as the latest pending value. The first Schedule after
// an idle period arms a flush `window` later; further calls inside the window
// only replace the pending value. The writer thread then performs exactly one
// write of the newest value.
//
// Destruction flushes a pending value immediately.
class DebouncedIndexWriter {
 public:
  using WriteFn = std::function<bool(int)>;

  static constexpr std::chrono::milliseconds kDefaultWindow{500};

  DebouncedIndexWriter(WriteFn write, std::chrono::milliseconds window = kDefaultWindow);
  ~DebouncedIndexWriter();

  DebouncedIndexWriter(const DebouncedIndexWriter&) = delete;
  DebouncedIndexWriter& operator=(const DebouncedIndexWriter&) = delete;

  void Schedule(int value);

  // Writes a pending value now, if any.
  void Flush();

  bool HasPending() const;

 private:
  void WriterLoop();
  void WriteLocked(std::unique_lock<std::mutex>& lock);

  const WriteFn write_;
  const std::chrono::milliseconds window_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<int> pending_;
  std::chrono::steady_clock::time_point deadline_;
  bool writing_ = false;
  bool shutdown_ = false;
  std::thread writer_thread_;
};

}  // namespace jukebox::sources

#endif  // JUKEBOX_SOURCES_DEBOUNCED_INDEX_WRITER_HPP_
