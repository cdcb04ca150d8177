// Repository: Jukebox-controller
// Component: JukeboxControl gRPC Service
// Purpose: Thin gRPC adapter over the Player Service and the button dispatcher.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_CONTROL_JUKEBOX_CONTROL_SERVICE_HPP_
#define JUKEBOX_CONTROL_JUKEBOX_CONTROL_SERVICE_HPP_

#include <grpcpp/grpcpp.h>

#include "jukebox/control/ButtonDispatcher.hpp"
#include "jukebox/player/PlayerService.hpp"
#include "jukebox_control.grpc.pb.h"
#include "jukebox_control.pb.h"

namespace jukebox::control {

// JukeboxControlImpl implements the service defined in jukebox_control.proto.
// Every RPC maps onto one PlayerService operation; there is no transport
// logic beyond request/response conversion. All RPCs fail with UNAVAILABLE
// until the player service has started its workers.
class JukeboxControlImpl final : public JukeboxControl::Service {
 public:
  static constexpr int kDefaultEventLimit = 20;

  JukeboxControlImpl(player::PlayerService& player, ButtonDispatcher& dispatcher);

  JukeboxControlImpl(const JukeboxControlImpl&) = delete;
  JukeboxControlImpl& operator=(const JukeboxControlImpl&) = delete;

  grpc::Status TogglePlay(grpc::ServerContext* context, const ActionRequest* request,
                          ActionResponse* response) override;
  grpc::Status Next(grpc::ServerContext* context, const ActionRequest* request,
                    ActionResponse* response) override;
  grpc::Status Previous(grpc::ServerContext* context, const ActionRequest* request,
                        ActionResponse* response) override;
  grpc::Status CycleSource(grpc::ServerContext* context, const ActionRequest* request,
                           ActionResponse* response) override;

  grpc::Status GetVolume(grpc::ServerContext* context, const GetVolumeRequest* request,
                         VolumeResponse* response) override;
  grpc::Status SetVolume(grpc::ServerContext* context, const SetVolumeRequest* request,
                         SetVolumeResponse* response) override;

  grpc::Status Announce(grpc::ServerContext* context, const AnnounceRequest* request,
                        ActionResponse* response) override;

  grpc::Status GetState(grpc::ServerContext* context, const GetStateRequest* request,
                        StateResponse* response) override;
  grpc::Status ButtonEdge(grpc::ServerContext* context, const ButtonEdgeRequest* request,
                          ButtonEdgeResponse* response) override;

  grpc::Status GetSystemVolume(grpc::ServerContext* context, const GetVolumeRequest* request,
                               SystemVolumeResponse* response) override;
  grpc::Status SetSystemVolume(grpc::ServerContext* context, const SetVolumeRequest* request,
                               SetVolumeResponse* response) override;
  grpc::Status ToggleMute(grpc::ServerContext* context, const ActionRequest* request,
                          SystemVolumeResponse* response) override;
  grpc::Status SetMaxVolume(grpc::ServerContext* context, const SetVolumeRequest* request,
                            SystemVolumeResponse* response) override;

 private:
  bool Ready() const { return player_.IsReady(); }
  void FillSystemVolume(SystemVolumeResponse* response);

  player::PlayerService& player_;
  ButtonDispatcher& dispatcher_;
};

}  // namespace jukebox::control

#endif  // JUKEBOX_CONTROL_JUKEBOX_CONTROL_SERVICE_HPP_
