#pragma once

#include <string>
#include <utility>
#include <vector>
#include <optional>

#include "ckpt/common.hpp"

namespace ckpt::util {

/**
 * @brief Process execution without a shell
 *
 * Commands are resolved on PATH and spawned with posix_spawn; arguments are
 * passed as a vector and never interpreted by a shell.
 */
class SafeProcess {
public:
  /**
   * @brief Result of a process execution
   */
  struct ProcessResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
    bool success() const { return exit_code == 0; }
  };

  /**
   * @brief Environment variables to set (or override) in the child
   */
  using Environment = std::vector<std::pair<std::string, std::string>>;

  /**
   * @brief Execute a command with arguments
   * @param command The command to execute (no shell interpretation)
   * @param args Command arguments
   * @param working_dir Optional working directory for the child
   * @param env Variables added to the inherited environment
   * @return Result of execution or error. A non-zero exit code is not an
   *         error at this level; check ProcessResult::success().
   */
  static Result<ProcessResult> execute(
    const std::string& command,
    const std::vector<std::string>& args = {},
    const std::optional<std::string>& working_dir = std::nullopt,
    const Environment& env = {}
  );

  /**
   * @brief Check if a command exists in PATH
   */
  static bool commandExists(const std::string& command);

  /**
   * @brief Find the full path of a command in PATH
   * @return Full path to command or nullopt if not found
   */
  static std::optional<std::string> findCommand(const std::string& command);

  /**
   * @brief Validate that a command name is safe for execution
   */
  static bool isValidCommand(const std::string& command);

  /**
   * @brief Validate that an argument is safe for execution
   */
  static bool isValidArgument(const std::string& arg);

private:
  SafeProcess() = default;
};

} // namespace ckpt::util
