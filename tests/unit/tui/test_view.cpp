#include <gtest/gtest.h>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include "ckpt/app/reducer.hpp"
#include "ckpt/tui/tui_app.hpp"
#include "ckpt/tui/view.hpp"

using namespace ckpt::app;
using namespace ckpt::tui;

namespace {

std::string renderToString(const AppState& state) {
  auto document = renderView(state);
  auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(120), ftxui::Dimension::Fixed(40));
  ftxui::Render(screen, document);
  return screen.ToString();
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

AppState readyState() {
  ckpt::repo::RepositoryStatus status;
  status.branch = "main";
  status.is_clean = false;
  status.modified = {"notes.txt"};
  status.untracked = {"draft.md"};
  status.ahead = 1;
  status.last_checkpoint = "First save abc1234";
  status.has_checkpoints = true;
  return reduce(initialState("Default"), event::StatusLoaded{status}).state;
}

}  // namespace

TEST(ViewTest, LoadingScreenShowsLabelOnly) {
  auto output = renderToString(initialState("Default"));

  EXPECT_TRUE(contains(output, "Working: Reading repository status..."));
  EXPECT_FALSE(contains(output, "Actions:"));
}

TEST(ViewTest, MainScreenShowsStatusAndMenu) {
  auto output = renderToString(readyState());

  EXPECT_TRUE(contains(output, "Branch: main (↑1 ↓0)"));
  EXPECT_TRUE(contains(output, "Last checkpoint: First save abc1234"));
  EXPECT_TRUE(contains(output, "Unsaved changes"));
  EXPECT_TRUE(contains(output, "• notes.txt"));
  EXPECT_TRUE(contains(output, "? draft.md"));
  EXPECT_TRUE(contains(output, "▶ Create checkpoint"));
  EXPECT_TRUE(contains(output, "Sync with remote"));
  EXPECT_TRUE(contains(output, "Hotkeys:"));
}

TEST(ViewTest, MissingRepositoryShowsGuidance) {
  auto state = reduce(initialState("Default"), event::RepositoryMissing{}).state;
  auto output = renderToString(state);

  EXPECT_TRUE(contains(output, "not tracked yet"));
  EXPECT_TRUE(contains(output, "▶ Start tracking this folder"));
  EXPECT_FALSE(contains(output, "Create checkpoint"));
  EXPECT_FALSE(contains(output, "Hotkeys:"));
}

TEST(ViewTest, ErrorAndNoticeLines) {
  auto state = readyState();
  state.last_error = ckpt::makeError(ckpt::ErrorCode::kPushFailed, "Sync failed: rejected");
  state.notice = "Already up to date";
  auto output = renderToString(state);

  EXPECT_TRUE(contains(output, "Error: Sync failed: rejected"));
  EXPECT_TRUE(contains(output, "⚠ Already up to date"));
}

TEST(ViewTest, DescriptionScreenListsNumberedSuggestions) {
  auto state = reduce(readyState(), KeyPress{KeyPress::Key::kCharacter, "c"}).state;
  std::vector<std::string> suggestions;
  for (int i = 1; i <= 11; ++i) {
    suggestions.push_back("idea " + std::to_string(i));
  }
  state = reduce(std::move(state), event::SuggestionsReady{suggestions}).state;
  state = reduce(std::move(state), KeyPress{KeyPress::Key::kCharacter, "w"}).state;
  auto output = renderToString(state);

  EXPECT_TRUE(contains(output, "> w_"));
  EXPECT_TRUE(contains(output, "[1] idea 1"));
  EXPECT_TRUE(contains(output, "[9] idea 9"));
  EXPECT_TRUE(contains(output, "idea 10"));
  EXPECT_FALSE(contains(output, "[10]"));
  EXPECT_FALSE(contains(output, "idea 11"));
}

TEST(ViewTest, HistoryRows) {
  ckpt::repo::Checkpoint checkpoint;
  checkpoint.id = "abcdef0123456789";
  checkpoint.message = "Saved it\n\nlong body";
  checkpoint.is_current = true;

  auto row = historyRow(checkpoint);
  EXPECT_NE(row.find(" abcdef0 - Saved it (current)"), std::string::npos);
  EXPECT_EQ(row.find("long body"), std::string::npos);
  EXPECT_EQ(row.size(), std::string("YYYY-MM-DD HH:MM abcdef0 - Saved it (current)").size());
}

TEST(ViewTest, EmptyHistory) {
  auto state = reduce(readyState(), KeyPress{KeyPress::Key::kCharacter, "h"}).state;
  state = reduce(std::move(state), event::HistoryLoaded{{}}).state;

  EXPECT_TRUE(contains(renderToString(state), "No checkpoints yet"));
}

TEST(KeyTranslationTest, NamedKeys) {
  using Key = KeyPress::Key;
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::ArrowUp)->key, Key::kUp);
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::ArrowDown)->key, Key::kDown);
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::Return)->key, Key::kEnter);
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::Escape)->key, Key::kEscape);
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::Backspace)->key, Key::kBackspace);
  EXPECT_EQ(TuiApp::translateKey(ftxui::Event::Special("\x03"))->key, Key::kCtrlC);
}

TEST(KeyTranslationTest, Characters) {
  auto space = TuiApp::translateKey(ftxui::Event::Character(' '));
  ASSERT_TRUE(space.has_value());
  EXPECT_EQ(space->key, KeyPress::Key::kCharacter);
  EXPECT_EQ(space->text, " ");

  auto wave = TuiApp::translateKey(ftxui::Event::Character("🌊"));
  ASSERT_TRUE(wave.has_value());
  EXPECT_EQ(wave->text, "🌊");
}

TEST(KeyTranslationTest, IgnoredEvents) {
  EXPECT_FALSE(TuiApp::translateKey(ftxui::Event::Tab).has_value());
  EXPECT_FALSE(TuiApp::translateKey(ftxui::Event::F1).has_value());
  EXPECT_FALSE(TuiApp::translateKey(TuiApp::completionEvent()).has_value());
}
