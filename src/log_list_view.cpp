#include "log_list_view.hpp"
#include <algorithm>
#include "line_composer.hpp"

static size_t sub_sat(size_t a, size_t b) { return a > b ? a - b : 0; }

ListWindow LogListView::update_window(const Rect& area, LogListState& state) const {
  const size_t list_height = static_cast<size_t>(area.height);
  const size_t last = items_.size() - 1;
  auto h = [&](size_t i) { return items_[i].height(area.width); };

  size_t start = std::min(state.offset_, last);
  size_t end = start;
  size_t height = 0;
  // rows of a trailing item that were cut off when it was counted
  size_t hidden = 0;

  for (size_t i = start; i < items_.size(); ++i) {
    size_t ih = h(i);
    if (height + ih > list_height) {
      if (height != list_height) {
        hidden = height + ih - list_height;
        height = list_height;
        ++end;
      }
      break;
    }
    ++end;
    height += ih;
  }

  const size_t selected = std::min(state.selected_.value_or(0), last);

  if (selected >= end) {
    height += hidden;
    while (selected >= end) {
      height += h(end);
      ++end;
      while (height > list_height && start < selected) {
        height = sub_sat(height, h(start));
        ++start;
      }
    }
  }
  while (selected < start) {
    --start;
    height += h(start);
    while (height > list_height && end > start + 1) {
      --end;
      height = sub_sat(height, h(end));
    }
  }

  state.offset_ = start;
  return ListWindow{start, end};
}

void LogListView::render(const Rect& area, CellBuffer& buf, LogListState& state) const {
  if (area.width < 1 || area.height < 1) return;
  if (items_.empty()) return;

  buf.set_style(area, config_.style);
  ListWindow win = update_window(area, state);
  std::optional<size_t> selected;
  if (state.selected_) selected = std::min(*state.selected_, items_.size() - 1);

  int current_row = area.top();
  for (size_t i = win.start; i < win.end; ++i) {
    const LogListItem& item = items_[i];
    const int y = current_row;
    if (y >= area.bottom()) break;
    const int item_height = static_cast<int>(item.height(area.width));
    current_row += item_height;

    Rect item_area{area.left(), y, area.width, std::min(item_height, area.bottom() - y)};
    buf.set_style(item_area, config_.style.patch(item.style()));
    if (selected && *selected == i) buf.set_style(item_area, config_.highlight_style);

    auto lines = compose(item.content(), area.width, state.find_text_, Style{}, config_.match_style);
    for (size_t j = 0; j < lines.size(); ++j) {
      int row = y + static_cast<int>(j);
      if (row >= area.bottom()) break;
      buf.set_spans(area.left(), row, lines[j], area.width);
    }
  }
}
