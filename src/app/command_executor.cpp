#include "ckpt/app/command_executor.hpp"

#include <spdlog/spdlog.h>

namespace ckpt::app {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

Event failed(Operation operation, const Error& error) {
  spdlog::error("{} failed: {} ({})", operationName(operation), error.message(),
                errorCodeToString(error.code()));
  return event::OperationFailed{operation, error};
}

}  // namespace

CommandExecutor::CommandExecutor(repo::RepositoryGateway& gateway,
                                 std::vector<std::string> suggestions)
  : gateway_(gateway), suggestions_(std::move(suggestions)) {}

Event CommandExecutor::execute(const Command& command) {
  auto operation = operationOf(command);
  spdlog::debug("executing: {}", operationName(operation));

  return std::visit(Overloaded{
      [&](const command::LoadStatus&) -> Event {
        auto result = gateway_.loadStatus();
        if (!result.has_value()) {
          if (result.error().code() == ErrorCode::kRepositoryNotFound) {
            return event::RepositoryMissing{};
          }
          return failed(operation, result.error());
        }
        return event::StatusLoaded{std::move(*result)};
      },
      [&](const command::PrepareSuggestions&) -> Event {
        return event::SuggestionsReady{suggestions_};
      },
      [&](const command::CreateCheckpoint& create) -> Event {
        auto result = gateway_.createCheckpoint(create.message);
        if (!result.has_value()) {
          return failed(operation, result.error());
        }
        return event::CheckpointCreated{std::move(*result)};
      },
      [&](const command::LoadHistory&) -> Event {
        auto result = gateway_.loadHistory();
        if (!result.has_value()) {
          return failed(operation, result.error());
        }
        return event::HistoryLoaded{std::move(*result)};
      },
      [&](const command::Rollback& rollback) -> Event {
        auto result = gateway_.rollback(rollback.id);
        if (!result.has_value()) {
          return failed(operation, result.error());
        }
        return event::RolledBack{std::move(*result)};
      },
      [&](const command::Sync&) -> Event {
        auto result = gateway_.sync();
        if (!result.has_value()) {
          return failed(operation, result.error());
        }
        return event::SyncCompleted{std::move(*result)};
      },
      [&](const command::InitRepository&) -> Event {
        auto result = gateway_.initRepository();
        if (!result.has_value()) {
          return failed(operation, result.error());
        }
        return event::RepositoryInitialized{};
      },
  }, command);
}

}  // namespace ckpt::app
