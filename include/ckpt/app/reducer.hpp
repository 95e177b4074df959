#pragma once

#include <optional>

#include "ckpt/app/commands.hpp"
#include "ckpt/app/events.hpp"
#include "ckpt/app/state.hpp"

namespace ckpt::app {

struct Transition {
  AppState state;
  std::optional<Command> command;
};

// State before the first event
AppState initialState(std::string default_message);

// Command issued at startup
Command initialCommand();

/**
 * @brief Apply one event to the state
 *
 * Pure: no I/O, no clock, no globals. A returned command puts the state
 * into loading; the runtime must run it and feed back its completion event.
 */
Transition reduce(AppState state, const Event& event);

}  // namespace ckpt::app
