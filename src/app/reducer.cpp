#include "ckpt/app/reducer.hpp"

#include <utility>

namespace ckpt::app {

namespace {

using Key = KeyPress::Key;

Transition stay(AppState state) {
  return Transition{std::move(state), std::nullopt};
}

Transition dispatch(AppState state, Command command) {
  state.loading = true;
  state.loading_label = std::string(loadingLabel(operationOf(command)));
  return Transition{std::move(state), std::move(command)};
}

// Common bookkeeping for every completion event
void finishOperation(AppState& state) {
  state.loading = false;
  state.loading_label.clear();
  state.last_error.reset();
}

void leaveHistory(AppState& state) {
  state.mode = Mode::kMain;
  state.checkpoints.clear();
  state.history_loaded = false;
  state.history_selection = 0;
}

bool isCharacter(const KeyPress& key, const char* text) {
  return key.key == Key::kCharacter && key.text == text;
}

// Remove the last UTF-8 encoded character
void popCharacter(std::string& text) {
  while (!text.empty()) {
    auto byte = static_cast<unsigned char>(text.back());
    text.pop_back();
    if ((byte & 0xC0) != 0x80) {
      break;
    }
  }
}

Transition activate(AppState state, MenuItem item) {
  switch (item) {
    case MenuItem::kInitRepository:
      return dispatch(std::move(state), command::InitRepository{});
    case MenuItem::kCreateCheckpoint:
      return dispatch(std::move(state), command::PrepareSuggestions{});
    case MenuItem::kHistory:
    case MenuItem::kRollback:
      return dispatch(std::move(state), command::LoadHistory{});
    case MenuItem::kSync:
      return dispatch(std::move(state), command::Sync{});
  }
  return stay(std::move(state));
}

// Hotkey jumps: move the selection onto the item, then activate it
Transition activateHotkey(AppState state, MenuItem item) {
  auto items = menuItems(state);
  for (size_t i = 0; i < items.size(); ++i) {
    if (items[i] == item) {
      state.menu_selection = i;
      return activate(std::move(state), item);
    }
  }
  return stay(std::move(state));
}

Transition reduceMainKey(AppState state, const KeyPress& key) {
  auto items = menuItems(state);

  if (key.key == Key::kEscape || isCharacter(key, "q")) {
    state.quitting = true;
    return stay(std::move(state));
  }
  if (key.key == Key::kUp || isCharacter(key, "k")) {
    if (state.menu_selection > 0) {
      --state.menu_selection;
    }
    state.menu_selection = clampSelection(state.menu_selection, items.size());
    return stay(std::move(state));
  }
  if (key.key == Key::kDown || isCharacter(key, "j")) {
    state.menu_selection = clampSelection(state.menu_selection + 1, items.size());
    return stay(std::move(state));
  }
  if (key.key == Key::kEnter || isCharacter(key, " ")) {
    if (items.empty()) {
      return stay(std::move(state));
    }
    state.menu_selection = clampSelection(state.menu_selection, items.size());
    auto item = items[state.menu_selection];
    return activate(std::move(state), item);
  }

  if (hotkeysEnabled(state)) {
    if (isCharacter(key, "c")) return activateHotkey(std::move(state), MenuItem::kCreateCheckpoint);
    if (isCharacter(key, "h")) return activateHotkey(std::move(state), MenuItem::kHistory);
    if (isCharacter(key, "r")) return activateHotkey(std::move(state), MenuItem::kRollback);
    if (isCharacter(key, "s")) return activateHotkey(std::move(state), MenuItem::kSync);
  }

  return stay(std::move(state));
}

Transition reduceDescriptionKey(AppState state, const KeyPress& key) {
  switch (key.key) {
    case Key::kEscape:
      state.mode = Mode::kMain;
      state.description_draft.clear();
      return stay(std::move(state));

    case Key::kEnter: {
      std::string message = state.description_draft.empty() ? state.default_message
                                                             : state.description_draft;
      state.mode = Mode::kMain;
      state.description_draft.clear();
      return dispatch(std::move(state), command::CreateCheckpoint{std::move(message)});
    }

    case Key::kBackspace:
      popCharacter(state.description_draft);
      return stay(std::move(state));

    case Key::kCharacter:
      if (key.text.size() == 1 && key.text[0] >= '1' && key.text[0] <= '9') {
        size_t index = static_cast<size_t>(key.text[0] - '1');
        if (index < state.suggestions.size()) {
          state.description_draft = state.suggestions[index];
        }
        return stay(std::move(state));
      }
      state.description_draft += key.text;
      return stay(std::move(state));

    default:
      return stay(std::move(state));
  }
}

Transition reduceHistoryKey(AppState state, const KeyPress& key) {
  if (key.key == Key::kEscape || key.key == Key::kBackspace) {
    leaveHistory(state);
    return stay(std::move(state));
  }
  if (isCharacter(key, "q")) {
    state.quitting = true;
    return stay(std::move(state));
  }
  if (key.key == Key::kUp || isCharacter(key, "k")) {
    if (state.history_selection > 0) {
      --state.history_selection;
    }
    state.history_selection = clampSelection(state.history_selection, state.checkpoints.size());
    return stay(std::move(state));
  }
  if (key.key == Key::kDown || isCharacter(key, "j")) {
    state.history_selection = clampSelection(state.history_selection + 1, state.checkpoints.size());
    return stay(std::move(state));
  }
  if (key.key == Key::kEnter || isCharacter(key, " ")) {
    if (state.checkpoints.empty()) {
      return stay(std::move(state));
    }
    std::string id = state.checkpoints[clampSelection(state.history_selection,
                                                      state.checkpoints.size())].id;
    leaveHistory(state);
    return dispatch(std::move(state), command::Rollback{std::move(id)});
  }
  return stay(std::move(state));
}

struct EventReducer {
  AppState state;

  Transition operator()(const KeyPress& key) {
    if (key.key == Key::kCtrlC) {
      state.quitting = true;
      return stay(std::move(state));
    }
    if (state.loading) {
      return stay(std::move(state));
    }

    state.notice.reset();
    switch (state.mode) {
      case Mode::kMain:
        return reduceMainKey(std::move(state), key);
      case Mode::kDescriptionEntry:
        return reduceDescriptionKey(std::move(state), key);
      case Mode::kHistory:
        return reduceHistoryKey(std::move(state), key);
    }
    return stay(std::move(state));
  }

  Transition operator()(const event::StatusLoaded& loaded) {
    finishOperation(state);
    state.repository = loaded.status.has_checkpoints ? RepositoryState::kReady
                                                     : RepositoryState::kEmpty;
    state.status = loaded.status;
    state.menu_selection = clampSelection(state.menu_selection, menuItems(state).size());
    return stay(std::move(state));
  }

  Transition operator()(const event::RepositoryMissing&) {
    finishOperation(state);
    state.repository = RepositoryState::kMissing;
    state.status.reset();
    state.menu_selection = 0;
    return stay(std::move(state));
  }

  Transition operator()(const event::OperationFailed& failed) {
    finishOperation(state);
    state.last_error = makeError(failed.error.code(),
                                 std::string(operationName(failed.operation)) + " failed: " +
                                 failed.error.message());
    return stay(std::move(state));
  }

  Transition operator()(const event::SuggestionsReady& ready) {
    finishOperation(state);
    state.mode = Mode::kDescriptionEntry;
    state.description_draft.clear();
    state.suggestions = ready.suggestions;
    return stay(std::move(state));
  }

  Transition operator()(const event::CheckpointCreated&) {
    finishOperation(state);
    return dispatch(std::move(state), command::LoadStatus{});
  }

  Transition operator()(const event::HistoryLoaded& loaded) {
    finishOperation(state);
    state.mode = Mode::kHistory;
    state.checkpoints = loaded.checkpoints;
    state.history_loaded = true;
    state.history_selection = 0;
    return stay(std::move(state));
  }

  Transition operator()(const event::RolledBack&) {
    finishOperation(state);
    return dispatch(std::move(state), command::LoadStatus{});
  }

  Transition operator()(const event::SyncCompleted& completed) {
    finishOperation(state);
    state.notice = completed.outcome.summary;
    if (completed.outcome.remote_configured) {
      return dispatch(std::move(state), command::LoadStatus{});
    }
    return stay(std::move(state));
  }

  Transition operator()(const event::RepositoryInitialized&) {
    finishOperation(state);
    state.menu_selection = 0;
    return dispatch(std::move(state), command::LoadStatus{});
  }
};

}  // namespace

AppState initialState(std::string default_message) {
  AppState state;
  state.default_message = std::move(default_message);
  // initialCommand() is already running
  state.loading = true;
  state.loading_label = std::string(loadingLabel(Operation::kLoadStatus));
  return state;
}

Command initialCommand() {
  return command::LoadStatus{};
}

Transition reduce(AppState state, const Event& event) {
  return std::visit(EventReducer{std::move(state)}, event);
}

}  // namespace ckpt::app
