#include "status_bar.hpp"
#include <sstream>
#include "utf8.hpp"

std::string StatusBar::text() const {
  if (info_.mode == Mode::Command) return ":" + info_.cmdline;
  if (info_.mode == Mode::Search) return "/" + info_.cmdline;
  std::ostringstream oss;
  oss << (info_.focused ? "LIST" : "LIST (blurred)") << "  "
      << (info_.source.empty() ? "[no file]" : info_.source);
  if (info_.item_count == 0) oss << "  0/0";
  else oss << "  " << (info_.selected ? std::to_string(*info_.selected + 1) : std::string("-")) << "/" << info_.item_count;
  if (!info_.find_text.empty()) oss << "  /" << info_.find_text;
  if (!info_.message.empty()) oss << "  | " << info_.message;
  return oss.str();
}

int StatusBar::cursor_col() const {
  if (info_.mode == Mode::Normal) return -1;
  return 1 + static_cast<int>(utf8_cells(info_.cmdline));
}

void StatusBar::render(const Rect& area, CellBuffer& buf) const {
  if (area.empty()) return;
  buf.set_style(area, style_);
  buf.set_string(area.left(), area.top(), text(), area.width, Style{});
}
