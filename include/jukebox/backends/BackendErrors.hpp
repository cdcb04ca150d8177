// Repository: Jukebox-controller
// Component: Backend Errors
// Purpose: Exception taxonomy raised by backend adapters and handled by workers.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_BACKEND_ERRORS_HPP_
#define JUKEBOX_BACKENDS_BACKEND_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace jukebox::backends {

// Backend unreachable or the connection dropped mid-operation.
class ConnectionFailure : public std::runtime_error {
 public:
  explicit ConnectionFailure(const std::string& what) : std::runtime_error(what) {}
};

// Connected, but the backend rejected or failed this particular operation.
class CommandFailure : public std::runtime_error {
 public:
  explicit CommandFailure(const std::string& what) : std::runtime_error(what) {}
};

// A required binary or data file is missing. Not worth retrying.
class ResourceUnavailable : public std::runtime_error {
 public:
  explicit ResourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_BACKEND_ERRORS_HPP_
