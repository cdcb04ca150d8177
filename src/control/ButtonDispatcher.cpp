// Repository: Jukebox-controller
// Component: Button Dispatcher
// Purpose: Maps debounced button edges onto Player Service operations.
// Copyright (c) 2026 Jukebox

#include "jukebox/control/ButtonDispatcher.hpp"

#include <utility>

#include "jukebox/util/Logger.hpp"

namespace jukebox::control {

using util::Logger;

std::map<int, std::string> ButtonDispatcher::DefaultPinMap() {
  return {
      {kPlayPausePin, "play_pause"},
      {kPreviousPin, "previous"},
      {kNextPin, "next"},
      {kCycleSourcePin, "cycle_source"},
  };
}

ButtonDispatcher::ButtonDispatcher(state::SharedPlaybackState& state, ButtonActions actions,
                                   std::map<int, std::string> pin_map)
    : state_(state), actions_(std::move(actions)), pin_map_(std::move(pin_map)) {}

std::optional<std::string> ButtonDispatcher::ActionFor(int pin_id) const {
  auto it = pin_map_.find(pin_id);
  if (it == pin_map_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> ButtonDispatcher::OnEdge(int pin_id, state::ButtonPhase phase) {
  const std::optional<std::string> action = ActionFor(pin_id);
  if (!action) {
    Logger::Warn("[ButtonDispatcher] edge on unmapped pin " + std::to_string(pin_id));
    state_.AddEvent(pin_id, phase, std::nullopt);
    return std::nullopt;
  }

  if (phase == state::ButtonPhase::kPressed) {
    state_.AddEvent(pin_id, phase, std::nullopt);
    return std::nullopt;
  }

  state_.AddEvent(pin_id, phase, action);
  Logger::Info("[ButtonDispatcher] pin " + std::to_string(pin_id) + " -> " + *action);
  Invoke(*action);
  return action;
}

void ButtonDispatcher::Invoke(const std::string& action) {
  const std::function<void()>* target = nullptr;
  if (action == "play_pause") {
    target = &actions_.play_pause;
  } else if (action == "previous") {
    target = &actions_.previous;
  } else if (action == "next") {
    target = &actions_.next;
  } else if (action == "cycle_source") {
    target = &actions_.cycle_source;
  }

  if (target == nullptr || !*target) {
    Logger::Info("[ButtonDispatcher] action '" + action + "' has no handler");
    return;
  }
  (*target)();
}

}  // namespace jukebox::control
