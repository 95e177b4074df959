#include "ckpt/app/commands.hpp"

namespace ckpt::app {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

Operation operationOf(const Command& command) {
  return std::visit(Overloaded{
      [](const command::LoadStatus&) { return Operation::kLoadStatus; },
      [](const command::PrepareSuggestions&) { return Operation::kPrepareSuggestions; },
      [](const command::CreateCheckpoint&) { return Operation::kCreateCheckpoint; },
      [](const command::LoadHistory&) { return Operation::kLoadHistory; },
      [](const command::Rollback&) { return Operation::kRollback; },
      [](const command::Sync&) { return Operation::kSync; },
      [](const command::InitRepository&) { return Operation::kInitRepository; },
  }, command);
}

std::string_view operationName(Operation operation) {
  switch (operation) {
    case Operation::kLoadStatus: return "Load status";
    case Operation::kPrepareSuggestions: return "Prepare suggestions";
    case Operation::kCreateCheckpoint: return "Create checkpoint";
    case Operation::kLoadHistory: return "Load history";
    case Operation::kRollback: return "Roll back";
    case Operation::kSync: return "Sync";
    case Operation::kInitRepository: return "Start tracking";
  }
  return "Unknown operation";
}

std::string_view loadingLabel(Operation operation) {
  switch (operation) {
    case Operation::kLoadStatus: return "Reading repository status...";
    case Operation::kPrepareSuggestions: return "Preparing suggestions...";
    case Operation::kCreateCheckpoint: return "Saving checkpoint...";
    case Operation::kLoadHistory: return "Loading history...";
    case Operation::kRollback: return "Rolling back...";
    case Operation::kSync: return "Syncing with remote...";
    case Operation::kInitRepository: return "Starting to track this folder...";
  }
  return "Working...";
}

}  // namespace ckpt::app
