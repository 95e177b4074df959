#pragma once

#include <memory>
#include <optional>

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>

#include "ckpt/app/command_executor.hpp"
#include "ckpt/app/event_queue.hpp"
#include "ckpt/app/reducer.hpp"
#include "ckpt/app/task_runner.hpp"
#include "ckpt/config/config.hpp"
#include "ckpt/repo/repository_gateway.hpp"

namespace ckpt::tui {

/**
 * @brief Full-screen terminal front end
 *
 * Owns the AppState. Terminal input and completion events are both fed to
 * app::reduce on the UI thread; commands it returns run on a TaskRunner and
 * come back through the EventQueue.
 */
class TuiApp {
public:
  TuiApp(repo::RepositoryGateway& gateway, const config::Config& config);
  ~TuiApp();

  TuiApp(const TuiApp&) = delete;
  TuiApp& operator=(const TuiApp&) = delete;

  // Run the main loop; returns the process exit code
  int run();

  // Dispatch the startup command. run() calls it once the screen is installed.
  void start();

  // Apply queued completions, then the event itself if it maps to a key
  bool handleEvent(const ftxui::Event& event);

  const app::AppState& state() const { return state_; }

  // Map a terminal event to a key press, nullopt for events the app ignores
  static std::optional<app::KeyPress> translateKey(const ftxui::Event& event);

  // Special event posted whenever a completion is queued
  static ftxui::Event completionEvent();

private:
  ftxui::ScreenInteractive screen_;
  app::AppState state_;
  app::CommandExecutor executor_;
  app::EventQueue queue_;
  ftxui::Component main_component_;

  // Last member: its destructor joins workers that use everything above
  std::unique_ptr<app::TaskRunner> runner_;

  ftxui::Component createMainComponent();
  void apply(const app::Event& event);
  void dispatch(app::Command command);
  void drainCompletions();
};

}  // namespace ckpt::tui
