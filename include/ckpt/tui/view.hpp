#pragma once

#include <ftxui/dom/elements.hpp>

#include "ckpt/app/state.hpp"

namespace ckpt::tui {

// Whole screen for the given state; a pure function of its argument
ftxui::Element renderView(const app::AppState& state);

ftxui::Element renderStatus(const repo::RepositoryStatus& status);
ftxui::Element renderMenu(const app::AppState& state);
ftxui::Element renderDescriptionEntry(const app::AppState& state);
ftxui::Element renderHistory(const app::AppState& state);

// "YYYY-MM-DD HH:MM <short id> - <message>[ (current)]"
std::string historyRow(const repo::Checkpoint& checkpoint);

}  // namespace ckpt::tui
