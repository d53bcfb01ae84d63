#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal used by tests; records drawn cells and styles
 *          so rendering can be asserted without a tty.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { ++refresh_count_; }

  void resize(int rows, int cols);
  std::string row(int r) const;
  const Style& style_at(int r, int c) const;
  int refresh_count() const { return refresh_count_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<Style> styles_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
  bool cursor_visible_ = true;
};
