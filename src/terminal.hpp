#pragma once
/*
 * Terminal
 *
 * Purpose: puts the tty in the mode the log viewer reads keys in and
 *          restores it on exit.
 * Usage: hold one in main for as long as the Viewer runs.
 * Note: raw unechoed keys with keypad decoding; Esc arrives after 25 ms so
 *       leaving Command/Search mode is immediate. The cursor starts hidden
 *       and Renderer shows it on the command line only.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
