#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  // before initscr so curses and utf8_width() measure text alike
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  curs_set(0);
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
