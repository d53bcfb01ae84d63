#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "viewer.hpp"
#include <filesystem>

int main(int argc, char** argv) {
  ViewerOptions opts;
  for (int i = 1; i < argc; ++i) opts.files.emplace_back(argv[i]);
  opts.rc_path = default_rc_path();
  Terminal term;
  NcursesTerminal screen;
  Viewer viewer(screen, opts);
  viewer.run();
  return 0;
}
