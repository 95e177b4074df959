#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "ckpt/common.hpp"
#include "ckpt/config/config.hpp"
#include "ckpt/repo/repository_gateway.hpp"
#include "ckpt/tui/tui_app.hpp"
#include "ckpt/util/logging.hpp"
#include "ckpt/vcs/git_cli_engine.hpp"

namespace {

struct Options {
  std::string config_file;
  bool debug = false;
};

ckpt::Result<ckpt::config::Config> loadConfig(const Options& options) {
  ckpt::config::Config config;

  if (!options.config_file.empty()) {
    auto loaded = config.load(options.config_file);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    return config;
  }

  auto default_path = ckpt::config::Config::defaultConfigPath();
  std::error_code ec;
  if (std::filesystem::exists(default_path, ec)) {
    auto loaded = config.load(default_path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
  }
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Checkpoint, roll back and sync the current folder"};
  app.set_version_flag("--version", ckpt::getVersion().toString());

  Options options;
  app.add_option("--config", options.config_file, "Path to config file");
  app.add_flag("--debug", options.debug, "Write a diagnostic log");

  CLI11_PARSE(app, argc, argv);

  try {
    std::error_code ec;
    auto working_dir = std::filesystem::current_path(ec);
    if (ec) {
      std::cerr << "Cannot read the working directory: " << ec.message() << std::endl;
      return 1;
    }

    auto config = loadConfig(options);
    if (!config) {
      std::cerr << "Failed to load configuration: " << config.error().message() << std::endl;
      return 1;
    }

    ckpt::util::LoggingOptions logging;
    logging.debug = options.debug || ckpt::util::debugRequestedByEnvironment();
    logging.log_file = config->debug_log.is_absolute() ? config->debug_log
                                                       : working_dir / config->debug_log;
    auto logging_ready = ckpt::util::setupLogging(logging);
    if (!logging_ready) {
      std::cerr << logging_ready.error().message() << std::endl;
      return 1;
    }

    ckpt::vcs::GitCliEngine engine(working_dir, config->git_binary);
    if (!engine.isAvailable()) {
      std::cerr << "git was not found on PATH (looked for '" << config->git_binary << "')"
                << std::endl;
      return 1;
    }

    ckpt::repo::GatewaySettings settings;
    settings.checkpoint_author = {config->checkpoint_identity.name,
                                  config->checkpoint_identity.email};
    settings.sync.remote = config->sync_remote;
    settings.sync.conflict_author = {config->conflict_identity.name,
                                     config->conflict_identity.email};

    ckpt::repo::EngineGateway gateway(engine, settings);
    spdlog::info("starting in {}", working_dir.string());

    ckpt::tui::TuiApp tui_app(gateway, *config);
    return tui_app.run();
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
