#pragma once

#include <string>
#include <vector>

#include "ckpt/common.hpp"
#include "ckpt/repo/models.hpp"
#include "ckpt/repo/sync_protocol.hpp"
#include "ckpt/vcs/engine.hpp"

namespace ckpt::repo {

/**
 * @brief The repository operations the application can request
 *
 * Implementations are called from worker threads, one operation at a time,
 * and report every failure through Result.
 */
class RepositoryGateway {
public:
  virtual ~RepositoryGateway() = default;

  // kRepositoryNotFound when the working directory is not a repository
  virtual Result<RepositoryStatus> loadStatus() = 0;

  // Stage everything and commit; returns "Checkpoint saved: <short id>"
  virtual Result<std::string> createCheckpoint(const std::string& message) = 0;

  // Most recent first, current HEAD flagged
  virtual Result<std::vector<Checkpoint>> loadHistory() = 0;

  // Hard reset to id; uncommitted changes to tracked files are lost
  virtual Result<std::string> rollback(const std::string& id) = 0;

  virtual Result<SyncOutcome> sync() = 0;

  virtual Result<void> initRepository() = 0;
};

struct GatewaySettings {
  vcs::Signature checkpoint_author{"ckpt", "ckpt@localhost"};
  SyncSettings sync;
};

/**
 * @brief RepositoryGateway on top of a vcs::Engine
 */
class EngineGateway : public RepositoryGateway {
public:
  EngineGateway(vcs::Engine& engine, GatewaySettings settings);

  Result<RepositoryStatus> loadStatus() override;
  Result<std::string> createCheckpoint(const std::string& message) override;
  Result<std::vector<Checkpoint>> loadHistory() override;
  Result<std::string> rollback(const std::string& id) override;
  Result<SyncOutcome> sync() override;
  Result<void> initRepository() override;

private:
  vcs::Engine& engine_;
  GatewaySettings settings_;
};

}  // namespace ckpt::repo
