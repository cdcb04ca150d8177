// Repository: Jukebox-controller
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the worker threads.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_UTIL_LOGGER_HPP_
#define JUKEBOX_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace jukebox::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the sequencer, video and announcer threads and the
// gRPC handlers never interleave.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when JUKEBOX_DEBUG env is set (poll noise, protocol)
// Warn  -> stderr (dropped commands, missing binaries, join timeouts)
// Error -> stderr (command failures)
//
// Test-only: the sinks receive every line of their level in addition to the
// console. Call with nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace jukebox::util

#endif  // JUKEBOX_UTIL_LOGGER_HPP_
