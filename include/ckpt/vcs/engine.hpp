#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "ckpt/common.hpp"

namespace ckpt::vcs {

/**
 * @brief Author/committer identity for a new commit
 */
struct Signature {
  std::string name;
  std::string email;
};

/**
 * @brief Working tree changes relative to HEAD
 */
struct WorkingTreeStatus {
  std::vector<std::string> staged;     // Changes recorded in the index
  std::vector<std::string> modified;   // Tracked files changed on disk but not staged
  std::vector<std::string> untracked;  // Files git does not know about

  bool isClean() const { return staged.empty() && modified.empty() && untracked.empty(); }
};

/**
 * @brief One commit as read from the log
 */
struct CommitInfo {
  std::string id;       // Full object hash
  std::string message;  // Full message, trailing whitespace removed
  std::string author;   // Author name
  std::chrono::system_clock::time_point timestamp;  // Author date
};

/**
 * @brief Commits the local branch is ahead/behind its upstream
 */
struct Divergence {
  int ahead = 0;
  int behind = 0;
};

/**
 * @brief Outcome of a fetch/integrate or push that did not fail
 */
enum class TransferResult {
  kTransferred,  // Something moved
  kUpToDate      // Nothing to do
};

/**
 * @brief Version-control engine operating on one working directory
 *
 * Every method reports failure through Result; none of them throws.
 */
class Engine {
public:
  virtual ~Engine() = default;

  // A repository exists at the working directory itself
  virtual bool hasRepository() const = 0;

  // Create an empty repository; kRepositoryExists if there already is one
  virtual Result<void> initRepository() = 0;

  virtual Result<WorkingTreeStatus> status() const = 0;

  // Short name of the checked-out branch (also valid before the first commit)
  virtual Result<std::string> currentBranch() const = 0;

  // HEAD commit id, nullopt when the branch has no commits yet
  virtual Result<std::optional<std::string>> headId() const = 0;

  // Commits reachable from HEAD, most recent first; empty before the first commit
  virtual Result<std::vector<CommitInfo>> log() const = 0;

  // Ahead/behind counts against the upstream branch, nullopt without an upstream
  virtual Result<std::optional<Divergence>> divergence() const = 0;

  // Stage every change including deletions and untracked files (kStageFailed)
  virtual Result<void> stageAll() = 0;

  // Commit the index as the given identity and return the new commit id (kCommitFailed)
  virtual Result<std::string> commit(const std::string& message, const Signature& author,
                                     bool allow_empty = false) = 0;

  // Full id of the commit named by rev, kNotFound if it does not name a commit
  virtual Result<std::string> resolveCommit(const std::string& rev) const = 0;

  // Move branch, index and working tree to id; discards uncommitted changes (kResetFailed)
  virtual Result<void> resetHard(const std::string& id) = 0;

  virtual Result<bool> hasRemote(const std::string& name) const = 0;

  // Fetch remote/branch and fast-forward onto it.
  // kUpToDate when HEAD did not move or the remote lacks the branch.
  virtual Result<TransferResult> pull(const std::string& remote, const std::string& branch) = 0;

  // Push HEAD to remote/branch; force overwrites the remote ref.
  // kUpToDate without contacting the remote while the branch has no commits.
  virtual Result<TransferResult> push(const std::string& remote, const std::string& branch,
                                      bool force) = 0;
};

}  // namespace ckpt::vcs
