#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace ckpt::app {

namespace command {

struct LoadStatus {};
struct PrepareSuggestions {};
struct CreateCheckpoint {
  std::string message;
};
struct LoadHistory {};
struct Rollback {
  std::string id;
};
struct Sync {};
struct InitRepository {};

}  // namespace command

// Work the reducer asks the runtime to perform off the UI thread
using Command = std::variant<command::LoadStatus,
                             command::PrepareSuggestions,
                             command::CreateCheckpoint,
                             command::LoadHistory,
                             command::Rollback,
                             command::Sync,
                             command::InitRepository>;

enum class Operation {
  kLoadStatus,
  kPrepareSuggestions,
  kCreateCheckpoint,
  kLoadHistory,
  kRollback,
  kSync,
  kInitRepository
};

Operation operationOf(const Command& command);

// Human readable action, e.g. "Create checkpoint"
std::string_view operationName(Operation operation);

// Progress text shown while the operation runs
std::string_view loadingLabel(Operation operation);

}  // namespace ckpt::app
