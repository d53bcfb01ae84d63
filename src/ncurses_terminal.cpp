#include "ncurses_terminal.hpp"

static short curses_color(Color c) {
  switch (c) {
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    case Color::Default: break;
  }
  return -1;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() != OK) {
      // without default colors, -1 is not a valid pair member
      assume_default_colors(COLOR_WHITE, COLOR_BLACK);
    }
    colors_ = true;
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::pair_for(Color fg, Color bg) {
  if (fg == Color::Default && bg == Color::Default) return 0;
  auto key = std::make_pair(fg, bg);
  if (auto it = pairs_.find(key); it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  short id = next_pair_++;
  init_pair(id, curses_color(fg), curses_color(bg));
  pairs_[key] = id;
  return id;
}

attr_t NcursesTerminal::attrs_for(const Style& style) {
  attr_t a = A_NORMAL;
  std::uint16_t m = style.add_modifier;
  if (m & Modifier::Bold) a |= A_BOLD;
  if (m & Modifier::Dim) a |= A_DIM;
  if (m & Modifier::Underline) a |= A_UNDERLINE;
  if (m & Modifier::Reverse) a |= A_REVERSE;
  if (colors_) {
    short p = pair_for(style.fg.value_or(Color::Default), style.bg.value_or(Color::Default));
    if (p > 0) a |= COLOR_PAIR(p);
  } else if (style.bg && *style.bg != Color::Default) {
    // monochrome: a background color is the only cue for selection/matches
    a |= A_REVERSE;
  }
  return a;
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  attr_t a = attrs_for(style);
  attron(a);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(a);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }
