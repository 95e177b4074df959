#pragma once

#include <filesystem>

#include "ckpt/common.hpp"

namespace ckpt::util {

struct LoggingOptions {
  bool debug = false;                 // Write the diagnostic log
  std::filesystem::path log_file;     // Target file when debug is on
};

// True when CKPT_DEBUG or DEBUG is set to a non-empty value
bool debugRequestedByEnvironment();

// Install the process-wide "ckpt" logger as spdlog's default.
// Without debug every message goes to a null sink: the terminal belongs to the UI.
Result<void> setupLogging(const LoggingOptions& options);

}  // namespace ckpt::util
