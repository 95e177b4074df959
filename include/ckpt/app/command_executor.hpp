#pragma once

#include <string>
#include <vector>

#include "ckpt/app/commands.hpp"
#include "ckpt/app/events.hpp"
#include "ckpt/repo/repository_gateway.hpp"

namespace ckpt::app {

/**
 * @brief Runs commands against a gateway
 *
 * Every command yields exactly one completion event; gateway errors become
 * event::OperationFailed. Safe to call from a worker thread as long as
 * only one command runs at a time.
 */
class CommandExecutor {
public:
  CommandExecutor(repo::RepositoryGateway& gateway, std::vector<std::string> suggestions);

  Event execute(const Command& command);

private:
  repo::RepositoryGateway& gateway_;
  std::vector<std::string> suggestions_;
};

}  // namespace ckpt::app
