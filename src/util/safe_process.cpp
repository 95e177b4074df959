#include "ckpt/util/safe_process.hpp"

#ifndef _WIN32
#include <unistd.h>
#include <sys/wait.h>
#include <spawn.h>
#include <poll.h>
#endif

#include <sys/stat.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>

#ifndef _WIN32
extern char **environ;
#endif

namespace ckpt::util {

namespace {

constexpr size_t kMaxOutputSize = 10 * 1024 * 1024; // 10MB per stream

void safeClose(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void appendBounded(std::string& out, const char* data, size_t len) {
  if (out.size() >= kMaxOutputSize) {
    return;
  }
  out.append(data, std::min(len, kMaxOutputSize - out.size()));
}

/**
 * @brief Owns a NULL-terminated char* array for execve-style calls
 */
class CStringArray {
public:
  explicit CStringArray(const std::vector<std::string>& strings) {
    storage_.reserve(strings.size());
    pointers_.reserve(strings.size() + 1);
    for (const auto& str : strings) {
      auto buffer = std::make_unique<char[]>(str.size() + 1);
      std::memcpy(buffer.get(), str.c_str(), str.size() + 1);
      pointers_.push_back(buffer.get());
      storage_.push_back(std::move(buffer));
    }
    pointers_.push_back(nullptr);
  }

  char* const* data() { return pointers_.data(); }

private:
  std::vector<std::unique_ptr<char[]>> storage_;
  std::vector<char*> pointers_;
};

#ifndef _WIN32
// Inherited environment with the given overrides replacing same-named entries
std::vector<std::string> buildEnvironment(const SafeProcess::Environment& overrides) {
  std::vector<std::string> result;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string var(*entry);
    auto eq = var.find('=');
    std::string name = var.substr(0, eq);
    bool overridden = false;
    for (const auto& [key, value] : overrides) {
      if (key == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      result.push_back(std::move(var));
    }
  }
  for (const auto& [key, value] : overrides) {
    result.push_back(key + "=" + value);
  }
  return result;
}

// Drain both pipes until EOF without letting either one block the other
void drainPipes(int& out_fd, int& err_fd, std::string& out, std::string& err) {
  char buffer[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    int out_index = -1;
    int err_index = -1;
    if (out_fd >= 0) {
      out_index = static_cast<int>(count);
      fds[count++] = pollfd{out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
      err_index = static_cast<int>(count);
      fds[count++] = pollfd{err_fd, POLLIN, 0};
    }

    if (poll(fds, count, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      safeClose(out_fd);
      safeClose(err_fd);
      return;
    }

    auto service = [&](int index, int& fd, std::string& sink) {
      if (index < 0 || fds[index].revents == 0) {
        return;
      }
      ssize_t n = read(fd, buffer, sizeof(buffer));
      if (n > 0) {
        appendBounded(sink, buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        safeClose(fd);
      }
    };
    service(out_index, out_fd, out);
    service(err_index, err_fd, err);
  }
}
#endif

}  // namespace

Result<SafeProcess::ProcessResult> SafeProcess::execute(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::optional<std::string>& working_dir,
    const Environment& env) {
#ifdef _WIN32
  return std::unexpected(makeError(ErrorCode::kProcessError,
                                   "Process execution not implemented on Windows"));
#else
  if (!isValidCommand(command)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Invalid command name: " + command));
  }

  for (const auto& arg : args) {
    if (!isValidArgument(arg)) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "Invalid argument: " + arg.substr(0, 50) + "..."));
    }
  }

  auto command_path = findCommand(command);
  if (!command_path.has_value()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Command not found: " + command));
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(stderr_pipe, O_CLOEXEC) == -1) {
    int saved = errno;
    safeClose(stdout_pipe[0]);
    safeClose(stdout_pipe[1]);
    safeClose(stderr_pipe[0]);
    safeClose(stderr_pipe[1]);
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to create pipes: " + std::string(strerror(saved))));
  }

  std::vector<std::string> full_args;
  full_args.push_back(command);
  full_args.insert(full_args.end(), args.begin(), args.end());
  CStringArray argv(full_args);
  CStringArray envp(buildEnvironment(env));

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);
  posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[0]);
  posix_spawn_file_actions_addclose(&file_actions, stdout_pipe[1]);
  posix_spawn_file_actions_addclose(&file_actions, stderr_pipe[1]);
  posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  // The child changes directory itself; the parent's cwd is shared by every thread.
  if (working_dir.has_value()) {
    posix_spawn_file_actions_addchdir_np(&file_actions, working_dir->c_str());
  }

  pid_t pid;
  int spawn_result = posix_spawn(&pid, command_path->c_str(), &file_actions, nullptr,
                                 argv.data(), envp.data());
  posix_spawn_file_actions_destroy(&file_actions);

  safeClose(stdout_pipe[1]);
  safeClose(stderr_pipe[1]);

  if (spawn_result != 0) {
    safeClose(stdout_pipe[0]);
    safeClose(stderr_pipe[0]);
    return std::unexpected(makeError(ErrorCode::kProcessError,
                                     "Failed to spawn " + command + ": " +
                                     std::string(strerror(spawn_result))));
  }

  ProcessResult result;
  drainPipes(stdout_pipe[0], stderr_pipe[0], result.stdout_output, result.stderr_output);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(makeError(ErrorCode::kSystemError,
                                       "Failed to wait for process: " + std::string(strerror(errno))));
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  return result;
#endif
}

bool SafeProcess::commandExists(const std::string& command) {
  return findCommand(command).has_value();
}

std::optional<std::string> SafeProcess::findCommand(const std::string& command) {
  if (!isValidCommand(command)) {
    return std::nullopt;
  }

  auto is_executable = [](const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && (st.st_mode & S_IXUSR);
  };

  if (command.front() == '/') {
    if (is_executable(command)) {
      return command;
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return std::nullopt;
  }

  std::istringstream path_stream{std::string(path_env)};
  std::string dir;
  while (std::getline(path_stream, dir, ':')) {
    if (dir.empty()) continue;

    std::string full_path = dir + "/" + command;
    if (is_executable(full_path)) {
      return full_path;
    }
  }

  return std::nullopt;
}

bool SafeProcess::isValidCommand(const std::string& command) {
  if (command.empty() || command.length() > 255) {
    return false;
  }

  const std::string dangerous_chars = "|&;(){}[]<>*?~$`\"'\\";
  for (char c : command) {
    if (dangerous_chars.find(c) != std::string::npos) {
      return false;
    }
    if (static_cast<unsigned char>(c) < 32) {
      return false;
    }
  }

  // Reject paths with .. to prevent directory traversal
  if (command.find("..") != std::string::npos) {
    return false;
  }

  return true;
}

bool SafeProcess::isValidArgument(const std::string& arg) {
  if (arg.length() > 4096) {
    return false;
  }

  // Commit messages may span lines; other control characters are rejected
  for (char c : arg) {
    if (static_cast<unsigned char>(c) < 32 && c != '\t' && c != '\n' && c != '\r') {
      return false;
    }
  }

  return true;
}

} // namespace ckpt::util
