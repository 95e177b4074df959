#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "ckpt/common.hpp"
#include "ckpt/repo/models.hpp"
#include "ckpt/vcs/engine.hpp"

namespace ckpt::repo {

namespace sync_notice {
inline constexpr const char* kNoRemote = "No remote configured, this is a local-only copy.";
inline constexpr const char* kUpToDate = "Already up to date";
inline constexpr const char* kConflictsResolved = "Conflicts auto-resolved";
inline constexpr const char* kPulled = "Pulled remote changes";
inline constexpr const char* kForcePushedOnly = "Force pushed local history";
inline constexpr const char* kPushedOnly = "Pushed local checkpoints";
}  // namespace sync_notice

struct SyncSettings {
  std::string remote = "origin";
  vcs::Signature conflict_author{"ckpt conflict resolver", "ckpt@localhost"};
  // Time source for the conflict commit message
  std::function<std::chrono::system_clock::time_point()> clock = [] {
    return std::chrono::system_clock::now();
  };
};

// "Auto-resolve conflicts: YYYY-MM-DD HH:MM:SS" in local time
std::string conflictCommitMessage(std::chrono::system_clock::time_point when);

/**
 * @brief Reconcile the local branch with its remote counterpart
 *
 * Pulls with fast-forward only. When that fails the local tree wins: pending
 * changes are committed as the conflict author and the push that follows
 * falls back to a forced push, overwriting remote history.
 *
 * A missing remote is reported in the outcome, not as an error. Errors are
 * kStageFailed / kCommitFailed while auto-resolving and kPushFailed when the
 * forced push is rejected too.
 */
Result<SyncOutcome> runSyncProtocol(vcs::Engine& engine, const SyncSettings& settings);

}  // namespace ckpt::repo
