#pragma once
/*
 * Viewer
 *
 * Purpose: host application around the log list: loads files, owns the
 *          status message/command line/options, routes keys, draws frames.
 * Note: the list widget only sees KeyEvents while it holds focus; host-level
 *       bindings (q, :, /, n/N, gg/G, counts) are handled here first.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cell_buffer.hpp"
#include "cmd_registry.hpp"
#include "config.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "log_list.hpp"
#include "log_list_view.hpp"
#include "renderer.hpp"
#include "types.hpp"

struct ViewerOptions {
  std::vector<std::filesystem::path> files;
  std::optional<std::filesystem::path> rc_path;
};

// $KANTENRC, else $HOME/.kantenrc; nullopt when neither can be determined.
std::optional<std::filesystem::path> default_rc_path();

std::string expand_tabs(const std::string& line, int tab_width);

class Viewer {
public:
  Viewer(ITerminal& term, const ViewerOptions& opts);
  void run();
  void render();
  void handle_input(int ch);
  void execute_command(const std::string& line);

  bool should_quit() const { return should_quit_; }
  Mode mode() const { return mode_; }
  const std::string& message() const { return message_; }
  const std::string& cmdline() const { return cmdline_; }
  const LogListModel& model() const { return model_; }
  LogListConfig list_config() const;
  int tab_width() const { return tab_width_; }
  bool level_color() const { return level_color_; }

private:
  ITerminal& term_;
  Renderer renderer_;
  CellBuffer frame_{Rect{}};
  CommandRegistry registry_;
  Input input_;
  LogListModel model_;

  Mode mode_ = Mode::Normal;
  bool should_quit_ = false;
  std::string message_;
  std::string cmdline_;
  std::string saved_find_;
  std::string source_;
  std::vector<std::string> raw_lines_;

  int tab_width_ = KANTEN_DEFAULT_TABSTOP;
  bool level_color_ = true;
  Color highlight_bg_ = Color::Blue;
  Color selected_bg_ = Color::Black;
  Color match_bg_ = Color::Yellow;

  void handle_normal_input(int ch);
  void handle_line_input(int ch);
  void register_commands();
  void load_rc(const std::filesystem::path& path);
  bool append_file(const std::filesystem::path& path);
  bool open_file(const std::filesystem::path& path);
  LogListItem make_item(const std::string& raw) const;
  void rebuild_items();
  void toggle_focus();
  void search_next(bool forward, bool include_current);
  size_t count_matches() const;
  void select_clamped(size_t index);
};
