#include "ckpt/app/state.hpp"

namespace ckpt::app {

std::vector<MenuItem> menuItems(const AppState& state) {
  if (state.repository == RepositoryState::kMissing) {
    return {MenuItem::kInitRepository};
  }
  return {MenuItem::kCreateCheckpoint, MenuItem::kHistory, MenuItem::kRollback, MenuItem::kSync};
}

bool hotkeysEnabled(const AppState& state) {
  return state.repository != RepositoryState::kMissing;
}

size_t clampSelection(size_t selection, size_t size) {
  if (size == 0) {
    return 0;
  }
  return selection < size ? selection : size - 1;
}

}  // namespace ckpt::app
