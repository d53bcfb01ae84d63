#pragma once
/*
 * StatusBar
 *
 * Purpose: one-row widget under the list: mode, source, position, message,
 *          or the command/search line while one is being typed.
 */
#include <optional>
#include <string>
#include "cell_buffer.hpp"
#include "style.hpp"
#include "types.hpp"
#include "widget.hpp"

struct StatusInfo {
  Mode mode = Mode::Normal;
  std::string source;          // loaded file, or empty
  size_t item_count = 0;
  std::optional<size_t> selected;
  bool focused = false;
  std::string find_text;
  std::string message;
  std::string cmdline;         // text after ':' or '/'
};

class StatusBar {
public:
  StatusBar(const StatusInfo& info, const Style& style) : info_(info), style_(style) {}
  void render(const Rect& area, CellBuffer& buf) const;
  std::string text() const;
  // Column of the input cursor in Command/Search mode, relative to the bar.
  int cursor_col() const;
private:
  const StatusInfo& info_;
  Style style_;
};

static_assert(Widget<StatusBar>, "StatusBar must be a widget");
