#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ckpt/vcs/engine.hpp"
#include "ckpt/util/safe_process.hpp"

namespace ckpt::vcs {

/**
 * @brief Engine backed by the git command line
 *
 * Each call spawns git in the repository directory through SafeProcess.
 * Output is parsed with LC_ALL=C so status words are stable, and terminal
 * credential prompts are disabled: the UI owns the terminal.
 */
class GitCliEngine : public Engine {
public:
  explicit GitCliEngine(std::filesystem::path repo_path, std::string git_binary = "git");

  const std::filesystem::path& path() const { return repo_path_; }

  // true when the git binary can be found
  bool isAvailable() const;

  bool hasRepository() const override;
  Result<void> initRepository() override;
  Result<WorkingTreeStatus> status() const override;
  Result<std::string> currentBranch() const override;
  Result<std::optional<std::string>> headId() const override;
  Result<std::vector<CommitInfo>> log() const override;
  Result<std::optional<Divergence>> divergence() const override;
  Result<void> stageAll() override;
  Result<std::string> commit(const std::string& message, const Signature& author,
                             bool allow_empty = false) override;
  Result<std::string> resolveCommit(const std::string& rev) const override;
  Result<void> resetHard(const std::string& id) override;
  Result<bool> hasRemote(const std::string& name) const override;
  Result<TransferResult> pull(const std::string& remote, const std::string& branch) override;
  Result<TransferResult> push(const std::string& remote, const std::string& branch,
                              bool force) override;

  // Parse `git status --porcelain=v1 -z` output
  static WorkingTreeStatus parsePorcelainStatus(const std::string& output);

  // Parse `git log -z --format=%H%x1f%an%x1f%at%x1f%B` output
  static std::vector<CommitInfo> parseLog(const std::string& output);

private:
  std::filesystem::path repo_path_;
  std::string git_binary_;

  Result<util::SafeProcess::ProcessResult> runGit(const std::vector<std::string>& args) const;
};

}  // namespace ckpt::vcs
