#pragma once

#include <string>
#include <variant>
#include <vector>

#include "ckpt/app/commands.hpp"
#include "ckpt/common.hpp"
#include "ckpt/repo/models.hpp"

namespace ckpt::app {

/**
 * @brief A key press, already translated from the terminal
 */
struct KeyPress {
  enum class Key {
    kUp,
    kDown,
    kEnter,
    kEscape,
    kBackspace,
    kCtrlC,
    kCharacter  // printable text in `text`, including space
  };

  Key key;
  std::string text;
};

namespace event {

struct StatusLoaded {
  repo::RepositoryStatus status;
};
struct RepositoryMissing {};
struct OperationFailed {
  Operation operation;
  Error error;
};
struct SuggestionsReady {
  std::vector<std::string> suggestions;
};
struct CheckpointCreated {
  std::string message;
};
struct HistoryLoaded {
  std::vector<repo::Checkpoint> checkpoints;
};
struct RolledBack {
  std::string message;
};
struct SyncCompleted {
  repo::SyncOutcome outcome;
};
struct RepositoryInitialized {};

}  // namespace event

using Event = std::variant<KeyPress,
                           event::StatusLoaded,
                           event::RepositoryMissing,
                           event::OperationFailed,
                           event::SuggestionsReady,
                           event::CheckpointCreated,
                           event::HistoryLoaded,
                           event::RolledBack,
                           event::SyncCompleted,
                           event::RepositoryInitialized>;

}  // namespace ckpt::app
