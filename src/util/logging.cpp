#include "ckpt/util/logging.hpp"

#include <cstdlib>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace ckpt::util {

namespace {

bool envFlagSet(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && value[0] != '\0';
}

}  // namespace

bool debugRequestedByEnvironment() {
  return envFlagSet("CKPT_DEBUG") || envFlagSet("DEBUG");
}

Result<void> setupLogging(const LoggingOptions& options) {
  if (!options.debug) {
    auto logger = std::make_shared<spdlog::logger>(
        "ckpt", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    spdlog::set_default_logger(logger);
    return {};
  }

  try {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file.string(), false);
    auto logger = std::make_shared<spdlog::logger>("ckpt", file_sink);

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Failed to open debug log " + options.log_file.string() +
                                     ": " + e.what()));
  }

  spdlog::info("debug logging enabled, version {}", getVersion().toString());
  return {};
}

}  // namespace ckpt::util
