// Repository: Jukebox-controller
// Component: JukeboxControl gRPC Service
// Purpose: Thin gRPC adapter over the Player Service and the button dispatcher.
// Copyright (c) 2026 Jukebox

#include "jukebox/control/JukeboxControlService.hpp"

#include <chrono>

#include "jukebox/util/Logger.hpp"

namespace jukebox::control {

namespace {

const grpc::Status kNotReady(grpc::StatusCode::UNAVAILABLE, "service not ready");

SourceKind ToProto(state::SourceKind kind) {
  switch (kind) {
    case state::SourceKind::kSequencer:
      return SOURCE_KIND_SEQUENCER;
    case state::SourceKind::kVideo:
      return SOURCE_KIND_VIDEO;
    case state::SourceKind::kNone:
      break;
  }
  return SOURCE_KIND_NONE;
}

ButtonPhase ToProto(state::ButtonPhase phase) {
  return phase == state::ButtonPhase::kReleased ? BUTTON_PHASE_RELEASED
                                                : BUTTON_PHASE_PRESSED;
}

}  // namespace

JukeboxControlImpl::JukeboxControlImpl(player::PlayerService& player,
                                       ButtonDispatcher& dispatcher)
    : player_(player), dispatcher_(dispatcher) {}

grpc::Status JukeboxControlImpl::TogglePlay(grpc::ServerContext* /*context*/,
                                            const ActionRequest* /*request*/,
                                            ActionResponse* response) {
  if (!Ready()) return kNotReady;
  player_.TogglePlay();
  response->set_accepted(true);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::Next(grpc::ServerContext* /*context*/,
                                      const ActionRequest* /*request*/,
                                      ActionResponse* response) {
  if (!Ready()) return kNotReady;
  player_.Next();
  response->set_accepted(true);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::Previous(grpc::ServerContext* /*context*/,
                                          const ActionRequest* /*request*/,
                                          ActionResponse* response) {
  if (!Ready()) return kNotReady;
  player_.Previous();
  response->set_accepted(true);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::CycleSource(grpc::ServerContext* /*context*/,
                                             const ActionRequest* /*request*/,
                                             ActionResponse* response) {
  if (!Ready()) return kNotReady;
  player_.CycleSource();
  response->set_accepted(true);
  if (auto current = player_.Sources().GetCurrent()) {
    response->set_message(current->display_name);
  }
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::GetVolume(grpc::ServerContext* /*context*/,
                                           const GetVolumeRequest* /*request*/,
                                           VolumeResponse* response) {
  if (!Ready()) return kNotReady;
  auto volume = player_.GetCurrentVolume();
  response->set_available(volume.has_value());
  response->set_level(volume.value_or(0));
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::SetVolume(grpc::ServerContext* /*context*/,
                                           const SetVolumeRequest* request,
                                           SetVolumeResponse* response) {
  if (!Ready()) return kNotReady;
  if (request->level() < 0 || request->level() > 100) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "level must be within 0..100");
  }
  response->set_success(player_.SetVolume(request->level(), request->synchronous()));
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::Announce(grpc::ServerContext* /*context*/,
                                          const AnnounceRequest* request,
                                          ActionResponse* response) {
  if (!Ready()) return kNotReady;
  if (request->text().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "text is required");
  }
  player_.Announce(request->text());
  response->set_accepted(true);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::GetState(grpc::ServerContext* /*context*/,
                                          const GetStateRequest* request,
                                          StateResponse* response) {
  if (!Ready()) return kNotReady;
  const state::PlaybackState snapshot = player_.State().GetSnapshot();

  response->set_is_playing(snapshot.is_playing);
  response->set_active_source_kind(ToProto(snapshot.active_source_kind));
  if (snapshot.current_track) {
    response->set_has_track(true);
    Track* track = response->mutable_current_track();
    track->set_title(snapshot.current_track->title);
    track->set_artist(snapshot.current_track->artist);
    track->set_album(snapshot.current_track->album);
    track->set_uri(snapshot.current_track->uri);
  }
  if (snapshot.position_seconds) {
    response->set_has_position(true);
    response->set_position_seconds(*snapshot.position_seconds);
  }
  if (snapshot.duration_seconds) {
    response->set_has_duration(true);
    response->set_duration_seconds(*snapshot.duration_seconds);
  }

  const int limit = request->event_limit() > 0 ? request->event_limit() : kDefaultEventLimit;
  for (const state::ButtonEvent& event :
       player_.State().RecentEvents(static_cast<size_t>(limit))) {
    ButtonEvent* out = response->add_recent_events();
    out->set_pin_id(event.pin_id);
    out->set_phase(ToProto(event.phase));
    out->set_action(event.action.value_or(""));
    out->set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                              event.timestamp.time_since_epoch())
                              .count());
  }

  for (const sources::MediaSource& source : player_.Sources().AllSources()) {
    Source* out = response->add_sources();
    out->set_kind(sources::ToString(source.kind));
    out->set_display_name(source.display_name);
    out->set_locator(source.locator);
    out->set_category(sources::ToString(source.category));
  }
  response->set_current_source_index(player_.Sources().CurrentIndex());
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::ButtonEdge(grpc::ServerContext* /*context*/,
                                            const ButtonEdgeRequest* request,
                                            ButtonEdgeResponse* response) {
  if (!Ready()) return kNotReady;
  const state::ButtonPhase phase = request->phase() == BUTTON_PHASE_RELEASED
                                       ? state::ButtonPhase::kReleased
                                       : state::ButtonPhase::kPressed;
  if (auto action = dispatcher_.OnEdge(request->pin_id(), phase)) {
    response->set_action(*action);
  }
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::GetSystemVolume(grpc::ServerContext* /*context*/,
                                                 const GetVolumeRequest* /*request*/,
                                                 SystemVolumeResponse* response) {
  if (!Ready()) return kNotReady;
  FillSystemVolume(response);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::SetSystemVolume(grpc::ServerContext* /*context*/,
                                                 const SetVolumeRequest* request,
                                                 SetVolumeResponse* response) {
  if (!Ready()) return kNotReady;
  response->set_success(player_.System().SetVolume(request->level()));
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::ToggleMute(grpc::ServerContext* /*context*/,
                                            const ActionRequest* /*request*/,
                                            SystemVolumeResponse* response) {
  if (!Ready()) return kNotReady;
  if (!player_.System().ToggleMute()) {
    util::Logger::Warn("[JukeboxControl] toggle mute: mixer did not respond");
  }
  FillSystemVolume(response);
  return grpc::Status::OK;
}

grpc::Status JukeboxControlImpl::SetMaxVolume(grpc::ServerContext* /*context*/,
                                              const SetVolumeRequest* request,
                                              SystemVolumeResponse* response) {
  if (!Ready()) return kNotReady;
  if (request->level() < 0 || request->level() > 100) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "level must be within 0..100");
  }
  player_.System().SetMaxLimit(request->level());
  FillSystemVolume(response);
  return grpc::Status::OK;
}

void JukeboxControlImpl::FillSystemVolume(SystemVolumeResponse* response) {
  player::SystemVolume& system = player_.System();
  auto level = system.GetVolume();
  response->set_available(level.has_value());
  response->set_level(level.value_or(0));
  response->set_muted(system.IsMuted().value_or(false));
  response->set_max_limit(system.MaxLimit());
}

}  // namespace jukebox::control
