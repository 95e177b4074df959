#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "ckpt/common.hpp"

namespace ckpt::config {

// Default checkpoint description suggestions, in display order
const std::vector<std::string>& defaultSuggestions();

// Configuration for the ckpt application
class Config {
 public:
  // Built-in defaults; nothing is read from disk
  Config();

  // Identity used as author and committer of generated commits
  struct Identity {
    std::string name;
    std::string email;
  };

  // git executable, resolved on PATH
  std::string git_binary = "git";

  // Diagnostic log written when debug logging is enabled
  std::filesystem::path debug_log = "debug.log";

  // Remote used by sync
  std::string sync_remote = "origin";

  // Author of user checkpoints
  Identity checkpoint_identity{"ckpt", "ckpt@localhost"};

  // Author of automatic conflict-resolution checkpoints
  Identity conflict_identity{"ckpt conflict resolver", "ckpt@localhost"};

  // Message used when the description is left empty
  std::string default_message = "Checkpoint without description";

  // Suggestions offered on the description screen
  std::vector<std::string> suggestions;

  // Overlay values from a TOML file; keys absent from the file keep their current value
  Result<void> load(const std::filesystem::path& config_path);

  // Path of the file most recently loaded (empty when running on defaults)
  const std::filesystem::path& configPath() const { return config_path_; }

  // Default config file location (XDG)
  static std::filesystem::path defaultConfigPath();

 private:
  std::filesystem::path config_path_;

  Result<void> validate() const;
};

}  // namespace ckpt::config
