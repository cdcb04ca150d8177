// Repository: Jukebox-controller
// Component: MPD Client
// Purpose: ISequencerClient over a TCP connection speaking the MPD text protocol.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_BACKENDS_MPD_CLIENT_HPP_
#define JUKEBOX_BACKENDS_MPD_CLIENT_HPP_

#include <chrono>
#include <string>

#include "jukebox/backends/ISequencerClient.hpp"
#include "jukebox/backends/MpdProtocol.hpp"

namespace jukebox::backends {

// Blocking client; one command in flight at a time. Socket reads and writes
// time out after io_timeout so a wedged server surfaces as ConnectionFailure
// instead of hanging the worker.
class MpdClient : public ISequencerClient {
 public:
  static constexpr std::chrono::milliseconds kDefaultIoTimeout{5000};

  explicit MpdClient(std::chrono::milliseconds io_timeout = kDefaultIoTimeout);
  ~MpdClient() override;

  MpdClient(const MpdClient&) = delete;
  MpdClient& operator=(const MpdClient&) = delete;

  void Connect(const std::string& host, int port) override;
  void Disconnect() override;

  void Play() override;
  void Pause() override;
  void Next() override;
  void Previous() override;
  void Stop() override;
  void Load(const std::string& locator, bool shuffle, bool autoplay) override;

  int GetVolume() override;
  void SetVolume(int level) override;

  SequencerPhase GetPhase() override;
  std::optional<state::TrackInfo> GetCurrentItem() override;
  SequencerTime GetTime() override;

  const std::string& ServerVersion() const { return server_version_; }

 private:
  mpd::Fields Command(const std::string& line);
  std::string ReadLine();
  void WriteAll(const std::string& data);
  void CloseSocket();

  const std::chrono::milliseconds io_timeout_;
  int fd_ = -1;
  std::string read_buffer_;
  std::string server_version_;
};

}  // namespace jukebox::backends

#endif  // JUKEBOX_BACKENDS_MPD_CLIENT_HPP_
