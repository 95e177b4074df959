#include "ckpt/vcs/git_cli_engine.hpp"

#include <cctype>
#include <ctime>
#include <sstream>

#include <spdlog/spdlog.h>

namespace ckpt::vcs {

namespace {

std::string trimRight(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.pop_back();
  }
  return text;
}

// First meaningful line of git's stderr, for error messages
std::string describeFailure(const util::SafeProcess::ProcessResult& result) {
  auto text = trimRight(result.stderr_output);
  if (text.empty()) {
    text = trimRight(result.stdout_output);
  }
  if (text.empty()) {
    return "git exited with code " + std::to_string(result.exit_code);
  }
  return text;
}

std::vector<std::string> splitOn(const std::string& text, char separator) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : text) {
    if (c == separator) {
      parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    parts.push_back(std::move(current));
  }
  return parts;
}

bool looksLikeOption(const std::string& value) {
  return !value.empty() && value.front() == '-';
}

}  // namespace

GitCliEngine::GitCliEngine(std::filesystem::path repo_path, std::string git_binary)
  : repo_path_(std::move(repo_path)), git_binary_(std::move(git_binary)) {}

bool GitCliEngine::isAvailable() const {
  return util::SafeProcess::commandExists(git_binary_);
}

Result<util::SafeProcess::ProcessResult> GitCliEngine::runGit(const std::vector<std::string>& args) const {
  static const util::SafeProcess::Environment kGitEnvironment = {
    {"LC_ALL", "C"},
    {"GIT_TERMINAL_PROMPT", "0"},
    {"GIT_OPTIONAL_LOCKS", "0"},
  };

  std::string command_line;
  for (const auto& arg : args) {
    command_line += ' ' + arg;
  }
  spdlog::debug("git{}", command_line);
  auto result = util::SafeProcess::execute(git_binary_, args, repo_path_.string(), kGitEnvironment);
  if (!result.has_value()) {
    spdlog::error("failed to run git: {}", result.error().message());
    return std::unexpected(makeError(ErrorCode::kExternalToolError,
                                     "Failed to run git: " + result.error().message()));
  }
  if (!result->success()) {
    spdlog::debug("git exited {}: {}", result->exit_code, trimRight(result->stderr_output));
  }
  return result;
}

bool GitCliEngine::hasRepository() const {
  std::error_code ec;
  return std::filesystem::exists(repo_path_ / ".git", ec);
}

Result<void> GitCliEngine::initRepository() {
  if (hasRepository()) {
    return std::unexpected(makeError(ErrorCode::kRepositoryExists,
                                     "A repository already exists in " + repo_path_.string()));
  }

  auto init_result = runGit({"init", "-q"});
  if (!init_result.has_value()) {
    return std::unexpected(init_result.error());
  }
  if (!init_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to initialize repository: " + describeFailure(*init_result)));
  }

  return {};
}

Result<WorkingTreeStatus> GitCliEngine::status() const {
  auto status_result = runGit({"status", "--porcelain=v1", "-z", "--untracked-files=all"});
  if (!status_result.has_value()) {
    return std::unexpected(status_result.error());
  }
  if (!status_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to get status: " + describeFailure(*status_result)));
  }
  return parsePorcelainStatus(status_result->stdout_output);
}

WorkingTreeStatus GitCliEngine::parsePorcelainStatus(const std::string& output) {
  WorkingTreeStatus status;
  auto entries = splitOn(output, '\0');

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (entry.size() < 4) {
      continue;
    }
    char index_state = entry[0];
    char tree_state = entry[1];
    std::string path = entry.substr(3);

    if (index_state == '?' && tree_state == '?') {
      status.untracked.push_back(path);
      continue;
    }
    if (index_state == '!') {
      continue;
    }
    if (index_state != ' ') {
      status.staged.push_back(path);
    }
    if (tree_state != ' ') {
      status.modified.push_back(path);
    }
    // Renames and copies carry the original path as a separate entry
    if (index_state == 'R' || index_state == 'C') {
      ++i;
    }
  }

  return status;
}

Result<std::string> GitCliEngine::currentBranch() const {
  auto branch_result = runGit({"symbolic-ref", "--short", "-q", "HEAD"});
  if (!branch_result.has_value()) {
    return std::unexpected(branch_result.error());
  }
  if (!branch_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError, "HEAD is detached"));
  }
  return trimRight(branch_result->stdout_output);
}

Result<std::optional<std::string>> GitCliEngine::headId() const {
  auto head_result = runGit({"rev-parse", "-q", "--verify", "HEAD^{commit}"});
  if (!head_result.has_value()) {
    return std::unexpected(head_result.error());
  }
  if (!head_result->success()) {
    // Unborn branch: no commits yet
    return std::optional<std::string>{};
  }
  return std::optional<std::string>{trimRight(head_result->stdout_output)};
}

Result<std::vector<CommitInfo>> GitCliEngine::log() const {
  auto head = headId();
  if (!head.has_value()) {
    return std::unexpected(head.error());
  }
  if (!head->has_value()) {
    return std::vector<CommitInfo>{};
  }

  auto log_result = runGit({"log", "-z", "--format=%H%x1f%an%x1f%at%x1f%B", "HEAD"});
  if (!log_result.has_value()) {
    return std::unexpected(log_result.error());
  }
  if (!log_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to read history: " + describeFailure(*log_result)));
  }
  return parseLog(log_result->stdout_output);
}

std::vector<CommitInfo> GitCliEngine::parseLog(const std::string& output) {
  std::vector<CommitInfo> commits;

  for (const auto& record : splitOn(output, '\0')) {
    auto fields = splitOn(record, '\x1f');
    if (fields.size() < 3) {
      continue;
    }

    CommitInfo info;
    info.id = trimRight(fields[0]);
    // A record may start with the newline that terminated the previous message
    info.id.erase(0, info.id.find_first_not_of("\n"));
    info.author = fields[1];
    try {
      info.timestamp = std::chrono::system_clock::from_time_t(
          static_cast<std::time_t>(std::stoll(fields[2])));
    } catch (const std::exception&) {
      info.timestamp = std::chrono::system_clock::time_point{};
    }
    info.message = fields.size() > 3 ? trimRight(fields[3]) : std::string{};
    commits.push_back(std::move(info));
  }

  return commits;
}

Result<std::optional<Divergence>> GitCliEngine::divergence() const {
  auto ab_result = runGit({"rev-list", "--left-right", "--count", "HEAD...@{upstream}"});
  if (!ab_result.has_value()) {
    return std::unexpected(ab_result.error());
  }
  if (!ab_result->success()) {
    return std::optional<Divergence>{};
  }

  Divergence counts;
  std::istringstream ab_stream(ab_result->stdout_output);
  ab_stream >> counts.ahead >> counts.behind;
  return std::optional<Divergence>{counts};
}

Result<void> GitCliEngine::stageAll() {
  auto add_result = runGit({"add", "-A"});
  if (!add_result.has_value()) {
    return std::unexpected(add_result.error());
  }
  if (!add_result->success()) {
    return std::unexpected(makeError(ErrorCode::kStageFailed,
                                     "Failed to stage changes: " + describeFailure(*add_result)));
  }
  return {};
}

Result<std::string> GitCliEngine::commit(const std::string& message, const Signature& author,
                                         bool allow_empty) {
  if (message.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Commit message cannot be empty"));
  }

  std::vector<std::string> args = {
    "-c", "user.name=" + author.name,
    "-c", "user.email=" + author.email,
    "-c", "commit.gpgsign=false",
    "commit", "-q", "--cleanup=verbatim", "-m", message,
  };
  if (allow_empty) {
    args.push_back("--allow-empty");
  }

  auto commit_result = runGit(args);
  if (!commit_result.has_value()) {
    return std::unexpected(commit_result.error());
  }
  if (!commit_result->success()) {
    return std::unexpected(makeError(ErrorCode::kCommitFailed,
                                     "Failed to create commit: " + describeFailure(*commit_result)));
  }

  auto head = headId();
  if (!head.has_value()) {
    return std::unexpected(head.error());
  }
  if (!head->has_value()) {
    return std::unexpected(makeError(ErrorCode::kCommitFailed,
                                     "Commit succeeded but HEAD is unborn"));
  }
  return **head;
}

Result<std::string> GitCliEngine::resolveCommit(const std::string& rev) const {
  if (rev.empty() || looksLikeOption(rev)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid revision: " + rev));
  }

  auto rev_result = runGit({"rev-parse", "-q", "--verify", rev + "^{commit}"});
  if (!rev_result.has_value()) {
    return std::unexpected(rev_result.error());
  }
  if (!rev_result->success()) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "Unknown checkpoint: " + rev));
  }
  return trimRight(rev_result->stdout_output);
}

Result<void> GitCliEngine::resetHard(const std::string& id) {
  if (id.empty() || looksLikeOption(id)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid checkpoint id: " + id));
  }

  auto reset_result = runGit({"reset", "--hard", "-q", id});
  if (!reset_result.has_value()) {
    return std::unexpected(reset_result.error());
  }
  if (!reset_result->success()) {
    return std::unexpected(makeError(ErrorCode::kResetFailed,
                                     "Failed to reset: " + describeFailure(*reset_result)));
  }
  return {};
}

Result<bool> GitCliEngine::hasRemote(const std::string& name) const {
  auto remote_result = runGit({"remote"});
  if (!remote_result.has_value()) {
    return std::unexpected(remote_result.error());
  }
  if (!remote_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to list remotes: " + describeFailure(*remote_result)));
  }

  std::istringstream remotes(remote_result->stdout_output);
  std::string line;
  while (std::getline(remotes, line)) {
    if (trimRight(line) == name) {
      return true;
    }
  }
  return false;
}

Result<TransferResult> GitCliEngine::pull(const std::string& remote, const std::string& branch) {
  if (looksLikeOption(remote) || looksLikeOption(branch)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid remote or branch name"));
  }

  auto before = headId();
  if (!before.has_value()) {
    return std::unexpected(before.error());
  }

  auto fetch_result = runGit({"fetch", "-q", remote, branch});
  if (!fetch_result.has_value()) {
    return std::unexpected(fetch_result.error());
  }
  if (!fetch_result->success()) {
    // Nothing published on the remote for this branch yet
    if (fetch_result->stderr_output.find("couldn't find remote ref") != std::string::npos) {
      return TransferResult::kUpToDate;
    }
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to fetch: " + describeFailure(*fetch_result)));
  }

  auto merge_result = runGit({"merge", "--ff-only", "-q", "FETCH_HEAD"});
  if (!merge_result.has_value()) {
    return std::unexpected(merge_result.error());
  }
  if (!merge_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to integrate remote changes: " + describeFailure(*merge_result)));
  }

  auto after = headId();
  if (!after.has_value()) {
    return std::unexpected(after.error());
  }
  return *before == *after ? TransferResult::kUpToDate : TransferResult::kTransferred;
}

Result<TransferResult> GitCliEngine::push(const std::string& remote, const std::string& branch,
                                          bool force) {
  if (looksLikeOption(remote) || looksLikeOption(branch)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid remote or branch name"));
  }

  // An unborn branch has no commits to publish
  auto head = headId();
  if (!head.has_value()) {
    return std::unexpected(head.error());
  }
  if (!head->has_value()) {
    spdlog::debug("push: no commits on {} yet", branch);
    return TransferResult::kUpToDate;
  }

  std::vector<std::string> args = {"push", "--porcelain"};
  if (force) {
    args.push_back("--force");
  }
  args.push_back(remote);
  args.push_back("HEAD:refs/heads/" + branch);

  auto push_result = runGit(args);
  if (!push_result.has_value()) {
    return std::unexpected(push_result.error());
  }
  if (!push_result->success()) {
    return std::unexpected(makeError(ErrorCode::kGitError,
                                     "Failed to push: " + describeFailure(*push_result)));
  }

  bool up_to_date = push_result->stdout_output.find("[up to date]") != std::string::npos ||
                    push_result->stderr_output.find("Everything up-to-date") != std::string::npos;
  return up_to_date ? TransferResult::kUpToDate : TransferResult::kTransferred;
}

}  // namespace ckpt::vcs
