// Repository: Jukebox-controller
// Component: Jukebox Controller Daemon
// Purpose: Wires the backends, workers, Player Service and gRPC surface together.
// Copyright (c) 2026 Jukebox

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "jukebox/backends/AmixerMixer.hpp"
#include "jukebox/backends/FileStateStore.hpp"
#include "jukebox/backends/MpdClient.hpp"
#include "jukebox/backends/MpvPlayerLauncher.hpp"
#include "jukebox/backends/PiperSynthesizer.hpp"
#include "jukebox/backends/YtDlpVideoSource.hpp"
#include "jukebox/config/JukeboxConfig.hpp"
#include "jukebox/control/ButtonDispatcher.hpp"
#include "jukebox/control/JukeboxControlService.hpp"
#include "jukebox/media/MediaProbe.hpp"
#include "jukebox/player/PlayerService.hpp"
#include "jukebox/sources/SourceManager.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"
#include "jukebox/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

constexpr const char* kPlayerIpcDir = "/tmp";

}  // namespace

int main(int argc, char* argv[]) {
  using namespace jukebox;
  using util::Logger;

  config::JukeboxConfig config;
  if (auto error = config::ParseCommandLine(argc, argv, config)) {
    std::cerr << "Error: " << *error << "\n\n";
    config::PrintUsage(argv[0]);
    return 1;
  }
  if (config.help) {
    config::PrintUsage(argv[0]);
    return 0;
  }
  if (auto error = config::ApplyEnvironment(config)) {
    std::cerr << "Error: " << *error << "\n\n";
    config::PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // Writes to a closed MPD socket or mpv IPC socket must fail, not kill us.
  std::signal(SIGPIPE, SIG_IGN);

  Logger::Info("[main] data dir " + config.data_dir + ", MPD " + config.mpd_host + ":" +
               std::to_string(config.mpd_port));

  backends::FileStateStore store(config.data_dir);
  state::SharedPlaybackState state;
  sources::SourceManager source_manager(store);

  player::PlayerBackends wiring;
  wiring.sequencer = std::make_unique<backends::MpdClient>();
  wiring.video_source = std::make_unique<backends::YtDlpVideoSource>();
  wiring.video_launcher = std::make_unique<backends::MpvPlayerLauncher>(kPlayerIpcDir, "video");
  wiring.synthesizer = std::make_unique<backends::PiperSynthesizer>(config.voice_model);
  wiring.announcement_launcher =
      std::make_unique<backends::MpvPlayerLauncher>(kPlayerIpcDir, "announce");
  wiring.probe = std::make_unique<media::FfmpegMediaProbe>();
  wiring.mixer = std::make_unique<backends::AmixerMixer>(config.mixer_control);

  player::PlayerServiceOptions options;
  options.sequencer.host = config.mpd_host;
  options.sequencer.port = config.mpd_port;
  options.video.max_videos = config.max_videos;
  options.announcement_cache_dir = config.EffectiveCacheDir();

  player::PlayerService player(std::move(wiring), state, source_manager, store, options);

  control::ButtonActions actions;
  actions.play_pause = [&player] { player.TogglePlay(); };
  actions.previous = [&player] { player.Previous(); };
  actions.next = [&player] { player.Next(); };
  actions.cycle_source = [&player] { player.CycleSource(); };
  control::ButtonDispatcher dispatcher(state, std::move(actions));

  control::JukeboxControlImpl service(player, dispatcher);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[main] could not listen on " + config.listen_address);
    return 1;
  }
  Logger::Info("[main] JukeboxControl listening on " + config.listen_address);

  player.Start();

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[main] shutting down");
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  player.Stop();
  Logger::Info("[main] bye");
  return 0;
}
