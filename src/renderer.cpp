#include "renderer.hpp"
#include <string>
#include "utf8.hpp"

void Renderer::present(ITerminal& term, const CellBuffer& frame, int cursor_row, int cursor_col) {
  const Rect& a = frame.area();
  term.clear();
  if (a.empty()) { term.refresh(); return; }
  for (int y = a.top(); y < a.bottom(); ++y) {
    int run_col = a.left();
    std::string run;
    Style run_style = frame.at(a.left(), y).style;
    int covered = 0;
    for (int x = a.left(); x < a.right(); ++x) {
      const Cell& c = frame.at(x, y);
      // columns already taken by the wide code point before them
      if (covered > 0) { --covered; continue; }
      if (!(c.style == run_style)) {
        term.draw_text(y, run_col, run, run_style);
        run.clear();
        run_col = x;
        run_style = c.style;
      }
      if (c.symbol.empty()) { run += ' '; continue; }
      run += c.symbol;
      covered = static_cast<int>(utf8_cells(c.symbol)) - 1;
    }
    if (!run.empty()) term.draw_text(y, run_col, run, run_style);
  }
  if (cursor_row >= 0 && cursor_col >= 0) {
    term.show_cursor(true);
    term.move_cursor(cursor_row, cursor_col);
  } else {
    term.show_cursor(false);
  }
  term.refresh();
}
