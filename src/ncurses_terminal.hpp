#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 *       Color pairs are allocated on first use of a (fg, bg) combination.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text, const Style& style) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
private:
  attr_t attrs_for(const Style& style);
  short pair_for(Color fg, Color bg);
  bool colors_ = false;
  std::map<std::pair<Color, Color>, short> pairs_;
  short next_pair_ = 1;
};
