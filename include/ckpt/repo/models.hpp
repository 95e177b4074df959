#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ckpt::repo {

// Shown as the last checkpoint of a repository without commits
inline constexpr const char* kNoCheckpointsYet = "No checkpoints yet";

/**
 * @brief Snapshot of the working directory shown on the main screen
 */
struct RepositoryStatus {
  std::string branch;
  bool is_clean = true;
  std::vector<std::string> staged;
  std::vector<std::string> modified;
  std::vector<std::string> untracked;
  int ahead = 0;
  int behind = 0;
  std::string last_checkpoint;   // "<message> <short id>" or kNoCheckpointsYet
  bool has_checkpoints = false;
};

/**
 * @brief One entry of the checkpoint history
 */
struct Checkpoint {
  std::string id;
  std::string message;
  std::string author;
  std::chrono::system_clock::time_point timestamp;
  bool is_current = false;  // id was HEAD when the history was loaded

  std::string shortId() const { return id.substr(0, 7); }
};

/**
 * @brief Result of one synchronization attempt
 */
struct SyncOutcome {
  bool pulled = false;
  bool pushed = false;
  bool conflict_auto_resolved = false;
  bool forced_push = false;
  bool remote_configured = false;
  std::string summary;
};

}  // namespace ckpt::repo
