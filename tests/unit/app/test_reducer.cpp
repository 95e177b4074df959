#include <gtest/gtest.h>

#include "ckpt/app/reducer.hpp"
#include "test_helpers.hpp"

using namespace ckpt::app;
using ckpt::ErrorCode;
using Key = KeyPress::Key;

namespace {

KeyPress key(Key k) {
  return KeyPress{k, {}};
}

KeyPress character(const std::string& text) {
  return KeyPress{Key::kCharacter, text};
}

ckpt::repo::RepositoryStatus readyStatus() {
  ckpt::repo::RepositoryStatus status;
  status.branch = "main";
  status.has_checkpoints = true;
  status.last_checkpoint = "first abc1234";
  return status;
}

std::vector<ckpt::repo::Checkpoint> threeCheckpoints() {
  std::vector<ckpt::repo::Checkpoint> checkpoints(3);
  checkpoints[0].id = "c3c3c3c3c3c3";
  checkpoints[0].message = "third";
  checkpoints[0].is_current = true;
  checkpoints[1].id = "b2b2b2b2b2b2";
  checkpoints[1].message = "second";
  checkpoints[2].id = "a1a1a1a1a1a1";
  checkpoints[2].message = "first";
  return checkpoints;
}

template <typename T>
bool holds(const std::optional<Command>& command) {
  return command.has_value() && std::holds_alternative<T>(*command);
}

}  // namespace

class ReducerTest : public ::testing::Test {
 protected:
  // Main mode, idle, repository with checkpoints
  AppState ready() {
    auto state = initialState("Default text");
    return reduce(std::move(state), event::StatusLoaded{readyStatus()}).state;
  }

  AppState missing() {
    return reduce(initialState("Default text"), event::RepositoryMissing{}).state;
  }

  AppState inHistory(AppState state) {
    auto loading = reduce(std::move(state), character("h"));
    return reduce(std::move(loading.state), event::HistoryLoaded{threeCheckpoints()}).state;
  }
};

TEST_F(ReducerTest, StartsLoadingStatus) {
  auto state = initialState("Default text");

  EXPECT_TRUE(state.loading);
  EXPECT_EQ(state.mode, Mode::kMain);
  EXPECT_EQ(state.repository, RepositoryState::kUnknown);
  EXPECT_TRUE(std::holds_alternative<command::LoadStatus>(initialCommand()));
}

TEST_F(ReducerTest, StatusLoadedClearsLoadingWithoutFollowUp) {
  auto result = reduce(initialState("x"), event::StatusLoaded{readyStatus()});

  EXPECT_FALSE(result.state.loading);
  EXPECT_FALSE(result.command.has_value());
  EXPECT_EQ(result.state.repository, RepositoryState::kReady);
  ASSERT_TRUE(result.state.status.has_value());
  EXPECT_EQ(result.state.status->branch, "main");
}

TEST_F(ReducerTest, StatusWithoutCheckpointsIsEmptyRepository) {
  auto status = readyStatus();
  status.has_checkpoints = false;
  auto result = reduce(initialState("x"), event::StatusLoaded{status});

  EXPECT_EQ(result.state.repository, RepositoryState::kEmpty);
  EXPECT_TRUE(hotkeysEnabled(result.state));
}

TEST_F(ReducerTest, MissingRepositoryOffersOnlyInit) {
  auto state = missing();

  EXPECT_FALSE(state.loading);
  EXPECT_FALSE(state.last_error.has_value());
  ASSERT_EQ(menuItems(state).size(), 1u);
  EXPECT_EQ(menuItems(state)[0], MenuItem::kInitRepository);

  auto result = reduce(std::move(state), key(Key::kEnter));
  EXPECT_TRUE(holds<command::InitRepository>(result.command));
  EXPECT_TRUE(result.state.loading);
}

TEST_F(ReducerTest, HotkeysIgnoredWithoutRepository) {
  for (const char* hotkey : {"c", "h", "r", "s"}) {
    auto result = reduce(missing(), character(hotkey));
    EXPECT_FALSE(result.command.has_value()) << hotkey;
    EXPECT_FALSE(result.state.loading) << hotkey;
  }
}

TEST_F(ReducerTest, HotkeysWorkAfterStatusLoadFailed) {
  auto state = reduce(initialState("x"),
                      event::OperationFailed{Operation::kLoadStatus,
                                             ckpt::makeError(ErrorCode::kGitError, "boom")}).state;
  ASSERT_EQ(state.repository, RepositoryState::kUnknown);
  ASSERT_EQ(menuItems(state).size(), 4u);

  auto result = reduce(std::move(state), character("s"));
  EXPECT_TRUE(holds<command::Sync>(result.command));
  EXPECT_TRUE(result.state.loading);
  EXPECT_EQ(result.state.menu_selection, 3u);
}

TEST_F(ReducerTest, RepositoryInitializedReloadsStatus) {
  auto state = reduce(missing(), key(Key::kEnter)).state;
  auto result = reduce(std::move(state), event::RepositoryInitialized{});

  EXPECT_TRUE(holds<command::LoadStatus>(result.command));
  EXPECT_TRUE(result.state.loading);
}

TEST_F(ReducerTest, MenuSelectionIsClamped) {
  auto state = ready();
  auto count = menuItems(state).size();

  state = reduce(std::move(state), key(Key::kUp)).state;
  EXPECT_EQ(state.menu_selection, 0u);

  for (size_t i = 0; i < count + 3; ++i) {
    auto result = reduce(std::move(state), character("j"));
    EXPECT_FALSE(result.command.has_value());
    state = std::move(result.state);
    EXPECT_LT(state.menu_selection, count);
  }
  EXPECT_EQ(state.menu_selection, count - 1);

  state = reduce(std::move(state), character("k")).state;
  EXPECT_EQ(state.menu_selection, count - 2);
}

TEST_F(ReducerTest, SelectionClampedWhenMenuShrinks) {
  auto state = ready();
  state.menu_selection = 3;
  auto result = reduce(std::move(state), event::RepositoryMissing{});

  EXPECT_EQ(result.state.menu_selection, 0u);
}

TEST_F(ReducerTest, KeysAbsorbedWhileLoading) {
  auto loading = reduce(ready(), character("s")).state;
  ASSERT_TRUE(loading.loading);

  for (auto press : {key(Key::kEnter), key(Key::kDown), key(Key::kEscape), character("q"),
                     character("c")}) {
    auto result = reduce(loading, press);
    EXPECT_FALSE(result.command.has_value());
    EXPECT_FALSE(result.state.quitting);
    EXPECT_EQ(result.state.menu_selection, loading.menu_selection);
    EXPECT_TRUE(result.state.loading);
  }
}

TEST_F(ReducerTest, CtrlCQuitsEvenWhileLoading) {
  auto loading = reduce(ready(), character("s")).state;
  auto result = reduce(std::move(loading), key(Key::kCtrlC));

  EXPECT_TRUE(result.state.quitting);
  EXPECT_FALSE(result.command.has_value());
}

TEST_F(ReducerTest, QuitKeysInMainMode) {
  EXPECT_TRUE(reduce(ready(), character("q")).state.quitting);
  EXPECT_TRUE(reduce(ready(), key(Key::kEscape)).state.quitting);
}

TEST_F(ReducerTest, CreateCheckpointFlow) {
  auto result = reduce(ready(), character("c"));
  EXPECT_TRUE(holds<command::PrepareSuggestions>(result.command));
  EXPECT_TRUE(result.state.loading);
  EXPECT_EQ(result.state.mode, Mode::kMain);

  result = reduce(std::move(result.state), event::SuggestionsReady{{"one", "two"}});
  EXPECT_EQ(result.state.mode, Mode::kDescriptionEntry);
  EXPECT_FALSE(result.state.loading);
  EXPECT_TRUE(result.state.description_draft.empty());

  for (const char* typed : {"f", "i", "x", " ", "q", "k"}) {
    result = reduce(std::move(result.state), character(typed));
    EXPECT_FALSE(result.state.quitting);
  }
  EXPECT_EQ(result.state.description_draft, "fix qk");

  result = reduce(std::move(result.state), key(Key::kEnter));
  ASSERT_TRUE(holds<command::CreateCheckpoint>(result.command));
  EXPECT_EQ(std::get<command::CreateCheckpoint>(*result.command).message, "fix qk");
  EXPECT_EQ(result.state.mode, Mode::kMain);
  EXPECT_TRUE(result.state.loading);

  result = reduce(std::move(result.state), event::CheckpointCreated{"Checkpoint saved: abc1234"});
  EXPECT_TRUE(holds<command::LoadStatus>(result.command));
}

TEST_F(ReducerTest, EmptyDescriptionUsesDefaultMessage) {
  auto state = reduce(ready(), character("c")).state;
  state = reduce(std::move(state), event::SuggestionsReady{{}}).state;
  auto result = reduce(std::move(state), key(Key::kEnter));

  ASSERT_TRUE(holds<command::CreateCheckpoint>(result.command));
  EXPECT_EQ(std::get<command::CreateCheckpoint>(*result.command).message, "Default text");
}

TEST_F(ReducerTest, EscapeCancelsDescriptionWithoutCommand) {
  auto state = reduce(ready(), character("c")).state;
  state = reduce(std::move(state), event::SuggestionsReady{{"one"}}).state;
  state = reduce(std::move(state), character("x")).state;

  auto result = reduce(std::move(state), key(Key::kEscape));
  EXPECT_FALSE(result.command.has_value());
  EXPECT_EQ(result.state.mode, Mode::kMain);
  EXPECT_TRUE(result.state.description_draft.empty());
  EXPECT_FALSE(result.state.quitting);
}

TEST_F(ReducerTest, DigitsPickSuggestions) {
  auto state = reduce(ready(), character("c")).state;
  state = reduce(std::move(state), event::SuggestionsReady{{"one", "two"}}).state;
  state = reduce(std::move(state), character("a")).state;

  state = reduce(std::move(state), character("2")).state;
  EXPECT_EQ(state.description_draft, "two");

  // No suggestion at 9: ignored, not typed
  state = reduce(std::move(state), character("9")).state;
  EXPECT_EQ(state.description_draft, "two");

  state = reduce(std::move(state), character("1")).state;
  EXPECT_EQ(state.description_draft, "one");
}

TEST_F(ReducerTest, PickedSuggestionBecomesCheckpointMessage) {
  auto state = reduce(ready(), character("c")).state;
  state = reduce(std::move(state), event::SuggestionsReady{{"one", "two", "three"}}).state;
  state = reduce(std::move(state), character("2")).state;

  auto result = reduce(std::move(state), key(Key::kEnter));
  ASSERT_TRUE(holds<command::CreateCheckpoint>(result.command));
  EXPECT_EQ(std::get<command::CreateCheckpoint>(*result.command).message, "two");
  EXPECT_EQ(result.state.mode, Mode::kMain);
  EXPECT_TRUE(result.state.loading);
}

TEST_F(ReducerTest, BackspaceRemovesWholeUtf8Character) {
  auto state = reduce(ready(), character("c")).state;
  state = reduce(std::move(state), event::SuggestionsReady{{}}).state;
  state = reduce(std::move(state), character("a")).state;
  state = reduce(std::move(state), character("é")).state;
  state = reduce(std::move(state), character("🌊")).state;
  EXPECT_EQ(state.description_draft, "aé🌊");

  state = reduce(std::move(state), key(Key::kBackspace)).state;
  EXPECT_EQ(state.description_draft, "aé");
  state = reduce(std::move(state), key(Key::kBackspace)).state;
  EXPECT_EQ(state.description_draft, "a");
  state = reduce(std::move(state), key(Key::kBackspace)).state;
  state = reduce(std::move(state), key(Key::kBackspace)).state;
  EXPECT_EQ(state.description_draft, "");
}

TEST_F(ReducerTest, HistoryAndRollbackBothLoadHistory) {
  EXPECT_TRUE(holds<command::LoadHistory>(reduce(ready(), character("h")).command));
  EXPECT_TRUE(holds<command::LoadHistory>(reduce(ready(), character("r")).command));
}

TEST_F(ReducerTest, HistoryLoadedEntersHistoryMode) {
  auto state = inHistory(ready());

  EXPECT_EQ(state.mode, Mode::kHistory);
  EXPECT_TRUE(state.history_loaded);
  EXPECT_EQ(state.history_selection, 0u);
  EXPECT_EQ(state.checkpoints.size(), 3u);
  EXPECT_FALSE(state.loading);
}

TEST_F(ReducerTest, HistorySelectionClampedAndRollbackUsesSelectedId) {
  auto state = inHistory(ready());

  for (int i = 0; i < 5; ++i) {
    state = reduce(std::move(state), key(Key::kDown)).state;
  }
  EXPECT_EQ(state.history_selection, 2u);
  state = reduce(std::move(state), key(Key::kUp)).state;
  EXPECT_EQ(state.history_selection, 1u);

  auto result = reduce(std::move(state), character(" "));
  ASSERT_TRUE(holds<command::Rollback>(result.command));
  EXPECT_EQ(std::get<command::Rollback>(*result.command).id, "b2b2b2b2b2b2");
  EXPECT_EQ(result.state.mode, Mode::kMain);
  EXPECT_TRUE(result.state.loading);
  EXPECT_TRUE(result.state.checkpoints.empty());

  result = reduce(std::move(result.state), event::RolledBack{"Rolled back to b2b2b2b"});
  EXPECT_TRUE(holds<command::LoadStatus>(result.command));
}

TEST_F(ReducerTest, EmptyHistoryIgnoresEnter) {
  auto state = reduce(ready(), character("h")).state;
  state = reduce(std::move(state), event::HistoryLoaded{{}}).state;
  EXPECT_EQ(state.mode, Mode::kHistory);
  EXPECT_TRUE(state.history_loaded);

  auto result = reduce(std::move(state), key(Key::kEnter));
  EXPECT_FALSE(result.command.has_value());
  EXPECT_EQ(result.state.history_selection, 0u);
}

TEST_F(ReducerTest, EscapeAndBackspaceLeaveHistory) {
  for (auto press : {key(Key::kEscape), key(Key::kBackspace)}) {
    auto result = reduce(inHistory(ready()), press);
    EXPECT_EQ(result.state.mode, Mode::kMain);
    EXPECT_TRUE(result.state.checkpoints.empty());
    EXPECT_FALSE(result.state.history_loaded);
    EXPECT_FALSE(result.state.quitting);
    EXPECT_FALSE(result.command.has_value());
  }
}

TEST_F(ReducerTest, QuitFromHistory) {
  EXPECT_TRUE(reduce(inHistory(ready()), character("q")).state.quitting);
}

TEST_F(ReducerTest, SyncNoticeShownAndClearedByNextKey) {
  auto state = reduce(ready(), character("s")).state;
  ckpt::repo::SyncOutcome outcome;
  outcome.remote_configured = true;
  outcome.pushed = true;
  outcome.summary = "Pushed local checkpoints";

  auto result = reduce(std::move(state), event::SyncCompleted{outcome});
  EXPECT_TRUE(holds<command::LoadStatus>(result.command));
  ASSERT_TRUE(result.state.notice.has_value());
  EXPECT_EQ(*result.state.notice, "Pushed local checkpoints");

  // The status reload keeps the notice
  result = reduce(std::move(result.state), event::StatusLoaded{readyStatus()});
  ASSERT_TRUE(result.state.notice.has_value());

  result = reduce(std::move(result.state), key(Key::kDown));
  EXPECT_FALSE(result.state.notice.has_value());
}

TEST_F(ReducerTest, LocalOnlySyncShowsNoticeWithoutReload) {
  auto state = reduce(ready(), character("s")).state;
  ckpt::repo::SyncOutcome outcome;
  outcome.summary = "No remote configured, this is a local-only copy.";

  auto result = reduce(std::move(state), event::SyncCompleted{outcome});
  EXPECT_FALSE(result.command.has_value());
  EXPECT_FALSE(result.state.loading);
  ASSERT_TRUE(result.state.notice.has_value());
  EXPECT_EQ(*result.state.notice, outcome.summary);
}

TEST_F(ReducerTest, FailureNamesOperationAndIsReplacedBySuccess) {
  auto state = reduce(ready(), character("s")).state;
  auto result = reduce(std::move(state),
                       event::OperationFailed{Operation::kSync,
                                              ckpt::makeError(ErrorCode::kPushFailed, "rejected")});

  EXPECT_FALSE(result.state.loading);
  EXPECT_FALSE(result.command.has_value());
  ASSERT_TRUE(result.state.last_error.has_value());
  EXPECT_EQ(result.state.last_error->code(), ErrorCode::kPushFailed);
  EXPECT_EQ(result.state.last_error->message(), "Sync failed: rejected");
  EXPECT_EQ(result.state.status->branch, "main");

  // Input does not clear the error; the next completion does
  result = reduce(std::move(result.state), key(Key::kDown));
  EXPECT_TRUE(result.state.last_error.has_value());

  result = reduce(std::move(result.state), character("h"));
  result = reduce(std::move(result.state), event::HistoryLoaded{threeCheckpoints()});
  EXPECT_FALSE(result.state.last_error.has_value());
}

TEST_F(ReducerTest, RollbackFailureKeepsMainMode) {
  auto state = inHistory(ready());
  state = reduce(std::move(state), key(Key::kEnter)).state;
  auto result = reduce(std::move(state),
                       event::OperationFailed{Operation::kRollback,
                                              ckpt::makeError(ErrorCode::kResetFailed, "nope")});

  EXPECT_EQ(result.state.mode, Mode::kMain);
  EXPECT_FALSE(result.state.loading);
  EXPECT_EQ(result.state.last_error->code(), ErrorCode::kResetFailed);
}
