#pragma once
/*
 * LogListView
 *
 * Purpose: draw a window of variable-height log items into a CellBuffer and
 *          keep the selected item inside that window.
 * State: LogListState::offset is the first item of the window; it persists
 *        across frames so the window only slides when the selection leaves it.
 * Constraint: cells outside `area` are never touched; offset is the only
 *             state written.
 */
#include <span>
#include "cell_buffer.hpp"
#include "log_list.hpp"
#include "style.hpp"
#include "types.hpp"
#include "widget.hpp"

struct LogListConfig {
  Style style;           // base style of the whole list area
  Style highlight_style; // layered on the selected item
  Style match_style;     // layered on search matches
};

struct ListWindow {
  size_t start = 0;
  size_t end = 0; // exclusive
};

class LogListView {
public:
  using State = LogListState;

  LogListView(std::span<const LogListItem> items, const LogListConfig& config)
    : items_(items), config_(config) {}

  void render(const Rect& area, CellBuffer& buf, LogListState& state) const;

  // Window for `area` given the persisted offset; moves state.offset_ so the
  // clamped selection is visible. Requires a non-empty list and width >= 1.
  ListWindow update_window(const Rect& area, LogListState& state) const;

private:
  std::span<const LogListItem> items_;
  LogListConfig config_;
};

static_assert(StatefulWidget<LogListView>, "LogListView must be a stateful widget");
