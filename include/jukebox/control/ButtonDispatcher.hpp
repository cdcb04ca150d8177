// Repository: Jukebox-controller
// Component: Button Dispatcher
// Purpose: Maps debounced button edges onto Player Service operations.
// Copyright (c) 2026 Jukebox

#ifndef JUKEBOX_CONTROL_BUTTON_DISPATCHER_HPP_
#define JUKEBOX_CONTROL_BUTTON_DISPATCHER_HPP_

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "jukebox/state/PlaybackState.hpp"
#include "jukebox/state/SharedPlaybackState.hpp"

namespace jukebox::control {

// The operations a button can trigger. PlayerService binds these in
// production; tests bind recorders.
struct ButtonActions {
  std::function<void()> play_pause;
  std::function<void()> previous;
  std::function<void()> next;
  std::function<void()> cycle_source;
};

class ButtonDispatcher {
 public:
  static constexpr int kPlayPausePin = 17;
  static constexpr int kPreviousPin = 27;
  static constexpr int kNextPin = 22;
  static constexpr int kCycleSourcePin = 23;

  // Default pin table: 17 play_pause, 27 previous, 22 next, 23 cycle_source.
  static std::map<int, std::string> DefaultPinMap();

  ButtonDispatcher(state::SharedPlaybackState& state, ButtonActions actions,
                   std::map<int, std::string> pin_map = DefaultPinMap());

  // Records the edge in the event log. Released edges on a mapped pin run
  // the action. Returns the action name for released edges on mapped pins.
  std::optional<std::string> OnEdge(int pin_id, state::ButtonPhase phase);

  std::optional<std::string> ActionFor(int pin_id) const;

 private:
  void Invoke(const std::string& action);

  state::SharedPlaybackState& state_;
  const ButtonActions actions_;
  const std::map<int, std::string> pin_map_;
};

}  // namespace jukebox::control

#endif  // JUKEBOX_CONTROL_BUTTON_DISPATCHER_HPP_
