#pragma once

#include <string_view>

#include "ckpt/app/state.hpp"

namespace ckpt::tui::text {

inline constexpr std::string_view kTitle = " ckpt: checkpoints for this folder ";
inline constexpr std::string_view kDescriptionTitle = " ckpt [new checkpoint] ";

inline constexpr std::string_view kMenuInit = "Start tracking this folder";
inline constexpr std::string_view kMenuCreate = "Create checkpoint";
inline constexpr std::string_view kMenuHistory = "Browse history";
inline constexpr std::string_view kMenuRollback = "Roll back to a checkpoint";
inline constexpr std::string_view kMenuSync = "Sync with remote";

inline constexpr std::string_view kLabelActions = "Actions:";
inline constexpr std::string_view kLabelHistory = "Checkpoints:";
inline constexpr std::string_view kLabelBranch = "Branch:";
inline constexpr std::string_view kLabelLastCheckpoint = "Last checkpoint:";
inline constexpr std::string_view kLabelStaged = "Staged:";
inline constexpr std::string_view kLabelModified = "Modified:";
inline constexpr std::string_view kLabelUntracked = "Untracked:";

inline constexpr std::string_view kPromptDescription = "Describe this checkpoint:";
inline constexpr std::string_view kPromptSuggestions = "Or pick one:";

inline constexpr std::string_view kTextNoRepository =
    "This folder is not tracked yet. Start tracking it to save checkpoints.";
inline constexpr std::string_view kTextNoCheckpoints = "No checkpoints yet";
inline constexpr std::string_view kTextCurrent = " (current)";
inline constexpr std::string_view kTextClean = "✓ Everything is saved";
inline constexpr std::string_view kTextDirty = "⚡ Unsaved changes";
inline constexpr std::string_view kTextLoading = "Working: ";
inline constexpr std::string_view kTextErrorPrefix = "Error: ";

inline constexpr std::string_view kHelpMain = "↑↓/jk Move | Enter Select | q/Esc Quit";
inline constexpr std::string_view kHelpHotkeys = "Hotkeys: [c] Save [h] History [r] Roll back [s] Sync";
inline constexpr std::string_view kHelpSyncWarning =
    "Sync pushes with --force when the remote rejects a push: remote-only commits are lost.";
inline constexpr std::string_view kHelpDescription = "[Enter Save] [Esc Cancel] [1-9 Pick suggestion]";
inline constexpr std::string_view kHelpHistory =
    "↑↓/jk Move | Enter Roll back (discards unsaved changes) | Esc Back | q Quit";

inline std::string_view menuLabel(app::MenuItem item) {
  switch (item) {
    case app::MenuItem::kInitRepository: return kMenuInit;
    case app::MenuItem::kCreateCheckpoint: return kMenuCreate;
    case app::MenuItem::kHistory: return kMenuHistory;
    case app::MenuItem::kRollback: return kMenuRollback;
    case app::MenuItem::kSync: return kMenuSync;
  }
  return "";
}

}  // namespace ckpt::tui::text
