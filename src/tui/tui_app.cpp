#include "ckpt/tui/tui_app.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>

#include <ftxui/component/loop.hpp>
#include <spdlog/spdlog.h>

#include "ckpt/tui/view.hpp"

using namespace ftxui;

namespace ckpt::tui {

// Global signal handling for emergency cleanup
static std::atomic<ScreenInteractive*> g_active_screen{nullptr};

static void signalHandler(int signal) {
  auto* screen = g_active_screen.load();
  if (screen) {
    screen->Exit();
  }
  std::exit(signal);
}

TuiApp::TuiApp(repo::RepositoryGateway& gateway, const config::Config& config)
    : screen_(ScreenInteractive::Fullscreen())
    , state_(app::initialState(config.default_message))
    , executor_(gateway, config.suggestions) {
  // Ctrl+C reaches the reducer as a key instead of tearing the loop down
  screen_.ForceHandleCtrlC(false);

  runner_ = std::make_unique<app::TaskRunner>([this](app::Event event) {
    queue_.push(std::move(event));
    screen_.PostEvent(completionEvent());
  });
  main_component_ = createMainComponent();
}

TuiApp::~TuiApp() {
  runner_.reset();
}

Event TuiApp::completionEvent() {
  return Event::Special("ckpt.completion");
}

std::optional<app::KeyPress> TuiApp::translateKey(const Event& event) {
  using Key = app::KeyPress::Key;

  if (event == Event::ArrowUp) return app::KeyPress{Key::kUp, {}};
  if (event == Event::ArrowDown) return app::KeyPress{Key::kDown, {}};
  if (event == Event::Return) return app::KeyPress{Key::kEnter, {}};
  if (event == Event::Escape) return app::KeyPress{Key::kEscape, {}};
  if (event == Event::Backspace) return app::KeyPress{Key::kBackspace, {}};
  if (event.input() == "\x03") return app::KeyPress{Key::kCtrlC, {}};

  if (event.is_character()) {
    const auto& character = event.character();
    if (!character.empty() && static_cast<unsigned char>(character[0]) >= 0x20 &&
        character[0] != 0x7f) {
      return app::KeyPress{Key::kCharacter, character};
    }
  }
  return std::nullopt;
}

int TuiApp::run() {
  // Install signal handlers for emergency cleanup
  g_active_screen.store(&screen_);
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  {
    // The loop installs the screen; wake-ups posted before that are dropped
    Loop loop(&screen_, main_component_);
    start();
    loop.Run();
  }

  // Let a running git command finish before the process goes away
  runner_->waitIdle();

  // Clear signal handlers
  g_active_screen.store(nullptr);
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  spdlog::info("ckpt exiting");
  return 0;
}

void TuiApp::start() {
  dispatch(app::initialCommand());
}

Component TuiApp::createMainComponent() {
  return Renderer([this] {
    return renderView(state_);
  }) | CatchEvent([this](Event event) {
    return handleEvent(event);
  });
}

bool TuiApp::handleEvent(const Event& event) {
  drainCompletions();
  if (event == completionEvent()) {
    return true;
  }

  auto key = translateKey(event);
  if (!key) {
    return false;
  }
  apply(*key);
  return true;
}

void TuiApp::drainCompletions() {
  for (auto& event : queue_.drain()) {
    apply(event);
  }
}

void TuiApp::apply(const app::Event& event) {
  auto transition = app::reduce(std::move(state_), event);
  state_ = std::move(transition.state);

  if (state_.quitting) {
    spdlog::debug("quit requested");
    screen_.Exit();
    return;
  }
  if (transition.command) {
    dispatch(std::move(*transition.command));
  }
}

void TuiApp::dispatch(app::Command command) {
  spdlog::debug("dispatching: {}", app::operationName(app::operationOf(command)));
  runner_->submit([this, command = std::move(command)] {
    return executor_.execute(command);
  });
}

}  // namespace ckpt::tui
