#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ckpt/common.hpp"
#include "ckpt/repo/models.hpp"

namespace ckpt::app {

enum class Mode {
  kMain,
  kDescriptionEntry,
  kHistory
};

enum class RepositoryState {
  kUnknown,   // status not loaded yet, or loading it failed
  kMissing,   // the folder is not a repository
  kEmpty,     // repository without checkpoints
  kReady
};

enum class MenuItem {
  kInitRepository,
  kCreateCheckpoint,
  kHistory,
  kRollback,
  kSync
};

/**
 * @brief Everything the screen shows
 *
 * Owned by the UI thread and changed only by reduce().
 */
struct AppState {
  Mode mode = Mode::kMain;

  bool loading = false;
  std::string loading_label;

  std::optional<repo::RepositoryStatus> status;
  RepositoryState repository = RepositoryState::kUnknown;

  std::vector<repo::Checkpoint> checkpoints;
  bool history_loaded = false;

  size_t menu_selection = 0;
  size_t history_selection = 0;

  std::string description_draft;
  std::vector<std::string> suggestions;
  std::string default_message = "Checkpoint without description";

  std::optional<std::string> notice;
  std::optional<Error> last_error;

  bool quitting = false;
};

// Entries of the main menu for the current repository state
std::vector<MenuItem> menuItems(const AppState& state);

// True when the menu offers the checkpoint actions, so their hotkeys apply
bool hotkeysEnabled(const AppState& state);

// Keep an index inside [0, size), or 0 for an empty list
size_t clampSelection(size_t selection, size_t size);

}  // namespace ckpt::app
