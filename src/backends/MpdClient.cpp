// Repository: Jukebox-controller
// Component: MPD Client
// Purpose: ISequencerClient over a TCP connection speaking the MPD text protocol.
// Copyright (c) 2026 Jukebox

#include "jukebox/backends/MpdClient.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "jukebox/backends/BackendErrors.hpp"
#include "jukebox/util/Logger.hpp"

namespace jukebox::backends {

namespace {

constexpr size_t kMaxLineBytes = 64 * 1024;

void SetSocketTimeouts(int fd, std::chrono::milliseconds timeout) {
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

}  // namespace

MpdClient::MpdClient(std::chrono::milliseconds io_timeout) : io_timeout_(io_timeout) {}

MpdClient::~MpdClient() {
  CloseSocket();
}

void MpdClient::Connect(const std::string& host, int port) {
  CloseSocket();

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
  if (rc != 0) {
    throw ConnectionFailure("resolve " + host + ": " + gai_strerror(rc));
  }

  int last_errno = 0;
  for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    SetSocketTimeouts(fd, io_timeout_);
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    last_errno = errno;
    close(fd);
  }
  freeaddrinfo(result);

  if (fd_ < 0) {
    throw ConnectionFailure("connect " + host + ":" + port_str + ": " +
                            std::strerror(last_errno));
  }

  read_buffer_.clear();
  auto version = mpd::ParseGreeting(ReadLine());
  if (!version) {
    CloseSocket();
    throw ConnectionFailure("connect " + host + ":" + port_str + ": not an MPD server");
  }
  server_version_ = *version;
}

void MpdClient::Disconnect() {
  if (fd_ >= 0) {
    // Best effort; the server drops the connection either way.
    ssize_t ignored = send(fd_, "close\n", 6, MSG_NOSIGNAL);
    (void)ignored;
  }
  CloseSocket();
}

void MpdClient::Play() { Command("play"); }

void MpdClient::Pause() { Command("pause 1"); }

void MpdClient::Next() { Command("next"); }

void MpdClient::Previous() { Command("previous"); }

void MpdClient::Stop() { Command("stop"); }

void MpdClient::Load(const std::string& locator, bool shuffle, bool autoplay) {
  Command("clear");
  Command("add " + mpd::QuoteArgument(locator));
  if (shuffle) Command("random 1");
  if (autoplay) Command("play");
}

int MpdClient::GetVolume() {
  auto volume = mpd::ParseVolume(Command("status"));
  if (!volume) throw CommandFailure("mpd: mixer volume unavailable");
  return *volume;
}

void MpdClient::SetVolume(int level) {
  level = std::clamp(level, 0, 100);
  Command("setvol " + std::to_string(level));
}

SequencerPhase MpdClient::GetPhase() {
  return mpd::ParsePhase(Command("status"));
}

std::optional<state::TrackInfo> MpdClient::GetCurrentItem() {
  return mpd::ParseCurrentSong(Command("currentsong"));
}

SequencerTime MpdClient::GetTime() {
  return mpd::ParseTime(Command("status"));
}

mpd::Fields MpdClient::Command(const std::string& line) {
  if (fd_ < 0) throw ConnectionFailure("mpd: not connected");
  util::Logger::Debug("[MpdClient] > " + line);
  WriteAll(line + "\n");

  mpd::Fields fields;
  for (;;) {
    std::string reply = ReadLine();
    if (mpd::IsTerminator(reply)) break;
    std::string key, value;
    if (mpd::ParseFieldLine(reply, &key, &value)) {
      fields.emplace_back(std::move(key), std::move(value));
    }
  }
  return fields;
}

std::string MpdClient::ReadLine() {
  for (;;) {
    size_t nl = read_buffer_.find('\n');
    if (nl != std::string::npos) {
      std::string line = read_buffer_.substr(0, nl);
      read_buffer_.erase(0, nl + 1);
      return line;
    }
    if (read_buffer_.size() > kMaxLineBytes) {
      CloseSocket();
      throw ConnectionFailure("mpd: response line too long");
    }
    char buf[4096];
    ssize_t n = recv(fd_, buf, sizeof(buf), 0);
    if (n > 0) {
      read_buffer_.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    const std::string reason = (n == 0) ? "connection closed" : std::strerror(errno);
    CloseSocket();
    throw ConnectionFailure("mpd: read failed: " + reason);
  }
}

void MpdClient::WriteAll(const std::string& data) {
  const char* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t n = send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      const std::string reason = std::strerror(errno);
      CloseSocket();
      throw ConnectionFailure("mpd: write failed: " + reason);
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
  }
}

void MpdClient::CloseSocket() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
  read_buffer_.clear();
}

}  // namespace jukebox::backends
