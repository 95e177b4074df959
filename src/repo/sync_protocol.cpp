#include "ckpt/repo/sync_protocol.hpp"

#include <spdlog/spdlog.h>

#include "ckpt/util/time.hpp"

namespace ckpt::repo {

namespace {

// Commit whatever the working tree holds so the local side can win the push
Result<void> autoResolveConflicts(vcs::Engine& engine, const SyncSettings& settings) {
  auto status_result = engine.status();
  if (!status_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kStageFailed,
                                     "Failed to inspect working tree: " + status_result.error().message()));
  }
  if (status_result->isClean()) {
    spdlog::info("sync: pull failed on a clean tree, local history will be pushed");
    return {};
  }

  auto stage_result = engine.stageAll();
  if (!stage_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kStageFailed,
                                     "Failed to stage changes: " + stage_result.error().message()));
  }

  auto message = conflictCommitMessage(settings.clock());
  auto commit_result = engine.commit(message, settings.conflict_author);
  if (!commit_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kCommitFailed,
                                     "Failed to commit conflict resolution: " +
                                     commit_result.error().message()));
  }

  spdlog::info("sync: committed local changes as {}", *commit_result);
  return {};
}

}  // namespace

std::string conflictCommitMessage(std::chrono::system_clock::time_point when) {
  return "Auto-resolve conflicts: " + util::Time::toLocalSeconds(when);
}

Result<SyncOutcome> runSyncProtocol(vcs::Engine& engine, const SyncSettings& settings) {
  SyncOutcome outcome;

  auto remote_result = engine.hasRemote(settings.remote);
  if (!remote_result.has_value()) {
    return std::unexpected(remote_result.error());
  }
  if (!*remote_result) {
    spdlog::info("sync: no remote named '{}'", settings.remote);
    outcome.summary = sync_notice::kNoRemote;
    return outcome;
  }
  outcome.remote_configured = true;

  auto branch_result = engine.currentBranch();
  if (!branch_result.has_value()) {
    return std::unexpected(branch_result.error());
  }
  const std::string& branch = *branch_result;

  // Pull
  std::string note;
  auto pull_result = engine.pull(settings.remote, branch);
  if (pull_result.has_value()) {
    if (*pull_result == vcs::TransferResult::kUpToDate) {
      note = sync_notice::kUpToDate;
    } else {
      outcome.pulled = true;
      note = sync_notice::kPulled;
    }
  } else {
    spdlog::warn("sync: pull from {}/{} failed, resolving locally: {}",
                 settings.remote, branch, pull_result.error().message());
    auto resolve_result = autoResolveConflicts(engine, settings);
    if (!resolve_result.has_value()) {
      spdlog::error("sync: {}", resolve_result.error().message());
      return std::unexpected(resolve_result.error());
    }
    outcome.conflict_auto_resolved = true;
    note = sync_notice::kConflictsResolved;
  }
  const bool nothing_pulled = note == sync_notice::kUpToDate;

  // Push
  auto push_result = engine.push(settings.remote, branch, false);
  if (push_result.has_value()) {
    if (*push_result == vcs::TransferResult::kUpToDate) {
      outcome.summary = nothing_pulled ? note : note + ", already up to date on push";
    } else {
      outcome.pushed = true;
      outcome.summary = nothing_pulled ? std::string(sync_notice::kPushedOnly) : note + ", pushed";
    }
    spdlog::info("sync: {}", outcome.summary);
    return outcome;
  }

  spdlog::warn("sync: push rejected, retrying with force: {}", push_result.error().message());
  auto force_result = engine.push(settings.remote, branch, true);
  if (!force_result.has_value()) {
    spdlog::error("sync: forced push failed: {}", force_result.error().message());
    return std::unexpected(makeError(ErrorCode::kPushFailed, force_result.error().message()));
  }

  outcome.pushed = true;
  outcome.forced_push = true;
  outcome.summary = nothing_pulled ? std::string(sync_notice::kForcePushedOnly) : note + ", force pushed";
  spdlog::info("sync: {}", outcome.summary);
  return outcome;
}

}  // namespace ckpt::repo
