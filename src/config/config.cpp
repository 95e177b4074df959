#include "ckpt/config/config.hpp"

#include <toml++/toml.hpp>

#include "ckpt/util/xdg.hpp"

namespace ckpt::config {

const std::vector<std::string>& defaultSuggestions() {
  static const std::vector<std::string> suggestions = {
    "Caught the wave 🌊",
    "Quick fix on the fly 🐛",
    "New feature ready ✨",
    "Refactoring for the soul 🧹",
    "Experimenting with code 🧪",
    "Just a save, in case 🛡️",
    "Made it pretty 🎨",
    "Optimization 🚀",
    "Tests are green ✅",
    "Vibe check 🤙",
    "Unstoppable progress 🔥",
    "Code magic 🪄",
    "Zen code 🧘",
    "One more step to release 🎯",
  };
  return suggestions;
}

Config::Config() : suggestions(defaultSuggestions()) {}

std::filesystem::path Config::defaultConfigPath() {
  return ckpt::util::Xdg::configFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["git_binary"].value<std::string>()) {
      git_binary = *value;
    }
    if (auto value = config_data["debug_log"].value<std::string>()) {
      debug_log = *value;
    }

    // Sync
    if (auto sync_table = config_data["sync"].as_table()) {
      if (auto value = (*sync_table)["remote"].value<std::string>()) {
        sync_remote = *value;
      }
    }

    // Commit identities
    if (auto identity_table = config_data["identity"].as_table()) {
      if (auto value = (*identity_table)["checkpoint_name"].value<std::string>()) {
        checkpoint_identity.name = *value;
      }
      if (auto value = (*identity_table)["checkpoint_email"].value<std::string>()) {
        checkpoint_identity.email = *value;
      }
      if (auto value = (*identity_table)["conflict_name"].value<std::string>()) {
        conflict_identity.name = *value;
      }
      if (auto value = (*identity_table)["conflict_email"].value<std::string>()) {
        conflict_identity.email = *value;
      }
    }

    // Checkpoint descriptions
    if (auto checkpoint_table = config_data["checkpoint"].as_table()) {
      if (auto value = (*checkpoint_table)["default_message"].value<std::string>()) {
        default_message = *value;
      }
      if (auto suggestions_array = (*checkpoint_table)["suggestions"].as_array()) {
        std::vector<std::string> loaded;
        for (const auto& element : *suggestions_array) {
          auto text = element.value<std::string>();
          if (!text) {
            return std::unexpected(makeError(ErrorCode::kConfigError,
                                             "checkpoint.suggestions must contain only strings"));
          }
          loaded.push_back(*text);
        }
        suggestions = std::move(loaded);
      }
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }

  auto valid = validate();
  if (!valid) {
    return valid;
  }

  config_path_ = config_path;
  return {};
}

Result<void> Config::validate() const {
  if (git_binary.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "git_binary must not be empty"));
  }
  if (sync_remote.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "sync.remote must not be empty"));
  }
  if (checkpoint_identity.name.empty() || checkpoint_identity.email.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "identity.checkpoint_name and checkpoint_email are required"));
  }
  if (conflict_identity.name.empty() || conflict_identity.email.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "identity.conflict_name and conflict_email are required"));
  }
  if (default_message.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "checkpoint.default_message must not be empty"));
  }
  return {};
}

}  // namespace ckpt::config
