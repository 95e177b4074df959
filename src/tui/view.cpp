#include "ckpt/tui/view.hpp"

#include <string>

#include "ckpt/tui/text.hpp"
#include "ckpt/util/time.hpp"

using namespace ftxui;

namespace ckpt::tui {

namespace {

Element line(std::string_view content) {
  return ftxui::text(std::string(content));
}

Element title(std::string_view content) {
  return line(content) | bold | bgcolor(Color::Blue) | color(Color::White);
}

std::string firstLine(const std::string& message) {
  auto end = message.find('\n');
  return end == std::string::npos ? message : message.substr(0, end);
}

void appendFileList(Elements& rows, std::string_view label, const std::vector<std::string>& files,
                    std::string_view marker, Color label_color) {
  if (files.empty()) {
    return;
  }
  rows.push_back(line(label) | bold | color(label_color));
  for (const auto& file : files) {
    rows.push_back(line("  " + std::string(marker) + " " + file));
  }
}

}  // namespace

std::string historyRow(const repo::Checkpoint& checkpoint) {
  std::string row = util::Time::toLocalMinutes(checkpoint.timestamp) + " " +
                    checkpoint.shortId() + " - " + firstLine(checkpoint.message);
  if (checkpoint.is_current) {
    row += text::kTextCurrent;
  }
  return row;
}

Element renderStatus(const repo::RepositoryStatus& status) {
  Elements rows;

  std::string branch = std::string(text::kLabelBranch) + " " + status.branch;
  if (status.ahead > 0 || status.behind > 0) {
    branch += " (↑" + std::to_string(status.ahead) + " ↓" + std::to_string(status.behind) + ")";
  }
  rows.push_back(line(branch));
  rows.push_back(line(std::string(text::kLabelLastCheckpoint) + " " + status.last_checkpoint));

  if (status.is_clean) {
    rows.push_back(line(text::kTextClean) | color(Color::Green));
  } else {
    rows.push_back(line(text::kTextDirty) | color(Color::Yellow));
  }

  appendFileList(rows, text::kLabelStaged, status.staged, "✓", Color::Green);
  appendFileList(rows, text::kLabelModified, status.modified, "•", Color::Yellow);
  appendFileList(rows, text::kLabelUntracked, status.untracked, "?", Color::White);

  return vbox(std::move(rows));
}

Element renderMenu(const app::AppState& state) {
  Elements rows;
  rows.push_back(line(text::kLabelActions) | bold);

  auto items = app::menuItems(state);
  for (size_t i = 0; i < items.size(); ++i) {
    auto label = std::string(text::menuLabel(items[i]));
    if (i == state.menu_selection) {
      rows.push_back(line("▶ " + label) | bold | color(Color::Magenta));
    } else {
      rows.push_back(line("  " + label));
    }
  }

  rows.push_back(separatorEmpty());
  rows.push_back(line(text::kHelpMain) | dim);
  if (app::hotkeysEnabled(state)) {
    rows.push_back(line(text::kHelpHotkeys) | dim);
    rows.push_back(line(text::kHelpSyncWarning) | dim);
  }
  return vbox(std::move(rows));
}

Element renderDescriptionEntry(const app::AppState& state) {
  Elements rows;
  rows.push_back(title(text::kDescriptionTitle));
  rows.push_back(separatorEmpty());
  rows.push_back(line(text::kPromptDescription));
  rows.push_back(line("> " + state.description_draft + "_"));
  rows.push_back(separatorEmpty());
  rows.push_back(line(text::kPromptSuggestions));

  for (size_t i = 0; i < state.suggestions.size() && i < 10; ++i) {
    std::string prefix = i < 9 ? " [" + std::to_string(i + 1) + "] " : "     ";
    rows.push_back(line(prefix + state.suggestions[i]));
  }

  rows.push_back(separatorEmpty());
  rows.push_back(line(text::kHelpDescription) | dim);
  return vbox(std::move(rows));
}

Element renderHistory(const app::AppState& state) {
  Elements rows;
  rows.push_back(line(text::kLabelHistory) | bold);
  rows.push_back(separatorEmpty());

  if (state.checkpoints.empty()) {
    rows.push_back(line(text::kTextNoCheckpoints));
  } else {
    for (size_t i = 0; i < state.checkpoints.size(); ++i) {
      bool selected = i == state.history_selection;
      auto row = line((selected ? "▶ " : "  ") + historyRow(state.checkpoints[i]));
      if (selected) {
        row = row | bold | color(Color::Magenta) | focus;
      }
      rows.push_back(row);
    }
  }

  rows.push_back(separatorEmpty());
  rows.push_back(line(text::kHelpHistory) | dim);
  return vbox(std::move(rows));
}

Element renderView(const app::AppState& state) {
  Elements rows;
  rows.push_back(title(text::kTitle));
  rows.push_back(separatorEmpty());

  if (state.loading) {
    rows.push_back(line(std::string(text::kTextLoading) + state.loading_label));
    return vbox(std::move(rows));
  }

  if (state.last_error) {
    rows.push_back(line(std::string(text::kTextErrorPrefix) + state.last_error->message()) |
                   bold | color(Color::Red));
    rows.push_back(separatorEmpty());
  }

  if (state.notice) {
    rows.push_back(line("⚠ " + *state.notice) | bold | color(Color::Yellow));
    rows.push_back(separatorEmpty());
  }

  switch (state.mode) {
    case app::Mode::kDescriptionEntry:
      rows.push_back(renderDescriptionEntry(state));
      break;
    case app::Mode::kHistory:
      rows.push_back(renderHistory(state) | yframe | flex);
      break;
    case app::Mode::kMain:
      if (state.repository == app::RepositoryState::kMissing) {
        rows.push_back(line(text::kTextNoRepository));
        rows.push_back(separatorEmpty());
      } else if (state.status) {
        rows.push_back(renderStatus(*state.status));
        rows.push_back(separatorEmpty());
      }
      rows.push_back(renderMenu(state));
      break;
  }

  return vbox(std::move(rows));
}

}  // namespace ckpt::tui
