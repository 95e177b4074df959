#include "ckpt/repo/repository_gateway.hpp"

#include <spdlog/spdlog.h>

namespace ckpt::repo {

namespace {

std::string firstLine(const std::string& message) {
  auto end = message.find('\n');
  return end == std::string::npos ? message : message.substr(0, end);
}

std::string shortId(const std::string& id) {
  return id.substr(0, 7);
}

}  // namespace

EngineGateway::EngineGateway(vcs::Engine& engine, GatewaySettings settings)
  : engine_(engine), settings_(std::move(settings)) {}

Result<RepositoryStatus> EngineGateway::loadStatus() {
  if (!engine_.hasRepository()) {
    return std::unexpected(makeError(ErrorCode::kRepositoryNotFound,
                                     "No repository in this folder"));
  }

  RepositoryStatus status;

  auto branch_result = engine_.currentBranch();
  status.branch = branch_result.has_value() ? *branch_result : "HEAD (detached)";

  auto tree_result = engine_.status();
  if (!tree_result.has_value()) {
    spdlog::error("loadStatus: {}", tree_result.error().message());
    return std::unexpected(tree_result.error());
  }
  status.is_clean = tree_result->isClean();
  status.staged = std::move(tree_result->staged);
  status.modified = std::move(tree_result->modified);
  status.untracked = std::move(tree_result->untracked);

  auto log_result = engine_.log();
  if (!log_result.has_value()) {
    spdlog::error("loadStatus: {}", log_result.error().message());
    return std::unexpected(log_result.error());
  }
  if (log_result->empty()) {
    status.last_checkpoint = kNoCheckpointsYet;
  } else {
    const auto& head = log_result->front();
    status.has_checkpoints = true;
    status.last_checkpoint = firstLine(head.message) + " " + shortId(head.id);
  }

  auto divergence_result = engine_.divergence();
  if (divergence_result.has_value() && divergence_result->has_value()) {
    status.ahead = (*divergence_result)->ahead;
    status.behind = (*divergence_result)->behind;
  }

  spdlog::debug("loadStatus: branch={} clean={} staged={} modified={} untracked={}",
                status.branch, status.is_clean, status.staged.size(),
                status.modified.size(), status.untracked.size());
  return status;
}

Result<std::string> EngineGateway::createCheckpoint(const std::string& message) {
  auto stage_result = engine_.stageAll();
  if (!stage_result.has_value()) {
    spdlog::error("createCheckpoint: {}", stage_result.error().message());
    return std::unexpected(makeError(ErrorCode::kStageFailed, stage_result.error().message()));
  }

  auto commit_result = engine_.commit(message, settings_.checkpoint_author, true);
  if (!commit_result.has_value()) {
    spdlog::error("createCheckpoint: {}", commit_result.error().message());
    return std::unexpected(makeError(ErrorCode::kCommitFailed, commit_result.error().message()));
  }

  spdlog::info("checkpoint {} created", *commit_result);
  return "Checkpoint saved: " + shortId(*commit_result);
}

Result<std::vector<Checkpoint>> EngineGateway::loadHistory() {
  auto head_result = engine_.headId();
  if (!head_result.has_value()) {
    return std::unexpected(head_result.error());
  }

  auto log_result = engine_.log();
  if (!log_result.has_value()) {
    spdlog::error("loadHistory: {}", log_result.error().message());
    return std::unexpected(log_result.error());
  }

  std::vector<Checkpoint> checkpoints;
  checkpoints.reserve(log_result->size());
  for (auto& commit : *log_result) {
    Checkpoint checkpoint;
    checkpoint.is_current = head_result->has_value() && commit.id == **head_result;
    checkpoint.id = std::move(commit.id);
    checkpoint.message = std::move(commit.message);
    checkpoint.author = std::move(commit.author);
    checkpoint.timestamp = commit.timestamp;
    checkpoints.push_back(std::move(checkpoint));
  }

  spdlog::debug("loadHistory: {} checkpoints", checkpoints.size());
  return checkpoints;
}

Result<std::string> EngineGateway::rollback(const std::string& id) {
  auto resolved = engine_.resolveCommit(id);
  if (!resolved.has_value()) {
    spdlog::error("rollback: {}", resolved.error().message());
    return std::unexpected(makeError(ErrorCode::kResetFailed,
                                     "Failed to roll back: " + resolved.error().message()));
  }

  auto reset_result = engine_.resetHard(*resolved);
  if (!reset_result.has_value()) {
    spdlog::error("rollback: {}", reset_result.error().message());
    return std::unexpected(makeError(ErrorCode::kResetFailed, reset_result.error().message()));
  }

  spdlog::info("rolled back to {}", *resolved);
  return "Rolled back to " + shortId(*resolved);
}

Result<SyncOutcome> EngineGateway::sync() {
  return runSyncProtocol(engine_, settings_.sync);
}

Result<void> EngineGateway::initRepository() {
  auto init_result = engine_.initRepository();
  if (!init_result.has_value()) {
    spdlog::error("initRepository: {}", init_result.error().message());
    return init_result;
  }
  spdlog::info("repository initialized");
  return {};
}

}  // namespace ckpt::repo
