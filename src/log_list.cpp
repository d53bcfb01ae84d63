#include "log_list.hpp"
#include "line_composer.hpp"

size_t LogListItem::height(int width) const {
  return line_height(content_, width);
}

void LogListState::select(std::optional<size_t> index) {
  selected_ = index;
  if (!index) offset_ = 0;
}

LogListModel::LogListModel() {
  state_.select(0);
}

void LogListModel::push(LogListItem item) {
  items_.push_back(std::move(item));
}

void LogListModel::clear() {
  items_.clear();
  state_.offset_ = 0;
  state_.selected_ = 0;
}

void LogListModel::replace_items(std::vector<LogListItem> items) {
  items_ = std::move(items);
  if (items_.empty()) state_.offset_ = 0;
}

void LogListModel::set_find_text(std::string text) {
  state_.find_text_ = std::move(text);
}

void LogListModel::next_if_exist() {
  if (items_.empty()) return;
  if (auto i = state_.selected(); i && *i + 1 < items_.size()) state_.select(*i + 1);
}

void LogListModel::previous_if_exist() {
  if (auto i = state_.selected(); i && *i > 0) state_.select(*i - 1);
}

void LogListModel::on_key(const KeyEvent& key) {
  if ((key.code == KeyCode::Char && key.ch == U'n' && key.mods == KeyMod::Ctrl) ||
      (key.code == KeyCode::Down && key.mods == KeyMod::None)) {
    next_if_exist();
  } else if ((key.code == KeyCode::Char && key.ch == U'p' && key.mods == KeyMod::Ctrl) ||
             (key.code == KeyCode::Up && key.mods == KeyMod::None)) {
    previous_if_exist();
  }
}
