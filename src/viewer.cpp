#include <ncurses.h>
#include "viewer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"
#include "log_level.hpp"
#include "status_bar.hpp"
#include "text_search.hpp"
#include "utf8.hpp"
#include "widget.hpp"

std::optional<std::filesystem::path> default_rc_path() {
  if (const char* rc = std::getenv(KANTEN_RC_ENV); rc && *rc) return std::filesystem::path(rc);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / KANTEN_RC_NAME;
}

std::string expand_tabs(const std::string& line, int tab_width) {
  if (line.find('\t') == std::string::npos) return line;
  int tw = std::max(1, tab_width);
  std::string out;
  out.reserve(line.size() + 8);
  size_t col = 0;
  for (size_t i = 0; i < line.size();) {
    if (line[i] == '\t') {
      size_t n = static_cast<size_t>(tw) - col % static_cast<size_t>(tw);
      out.append(n, ' ');
      col += n;
      ++i;
      continue;
    }
    size_t n = utf8_next(line, i);
    out.append(line, i, n);
    col += static_cast<size_t>(utf8_width(line, i, n));
    i += n;
  }
  return out;
}

Viewer::Viewer(ITerminal& term, const ViewerOptions& opts) : term_(term) {
  model_.focus();
  register_commands();
  if (opts.rc_path) load_rc(*opts.rc_path);
  for (const auto& f : opts.files) append_file(f);
}

void Viewer::run() {
  while (!should_quit_) {
    render();
    int ch = getch();
    if (ch == ERR || ch == KEY_RESIZE) continue;
    handle_input(ch);
  }
}

LogListConfig Viewer::list_config() const {
  LogListConfig cfg;
  Color sel = model_.state().focused() ? highlight_bg_ : selected_bg_;
  cfg.highlight_style.with_bg(sel);
  if (model_.state().focused()) cfg.highlight_style.add(Modifier::Bold);
  cfg.match_style.with_fg(Color::Black).with_bg(match_bg_);
  return cfg;
}

void Viewer::render() {
  TermSize sz = term_.getSize();
  frame_.resize(Rect{0, 0, sz.cols, sz.rows});
  int list_rows = std::max(0, sz.rows - KANTEN_STATUS_ROWS);
  Rect list_area{0, 0, sz.cols, list_rows};
  Rect status_area{0, list_rows, sz.cols, sz.rows - list_rows};

  LogListView view(model_.items(), list_config());
  render_widget(view, list_area, frame_, model_.state());

  StatusInfo info;
  info.mode = mode_;
  info.source = source_;
  info.item_count = model_.items().size();
  info.selected = model_.state().selected();
  info.focused = model_.state().focused();
  info.find_text = model_.state().find_text();
  info.message = message_;
  info.cmdline = cmdline_;
  StatusBar bar(info, Style{}.add(Modifier::Reverse));
  render_widget(bar, status_area, frame_);

  int cursor_col = bar.cursor_col();
  if (cursor_col >= 0) cursor_col = std::min(cursor_col, std::max(0, sz.cols - 1));
  renderer_.present(term_, frame_, cursor_col >= 0 ? status_area.top() : -1, cursor_col);
}

void Viewer::handle_input(int ch) {
  if (mode_ == Mode::Command || mode_ == Mode::Search) { handle_line_input(ch); return; }
  handle_normal_input(ch);
}

void Viewer::handle_normal_input(int ch) {
  KeyEvent key = decode_key(ch);
  if (ch != 'g') input_.reset();
  bool focused = model_.state().focused();
  switch (ch) {
    case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
      input_.consumeDigit(ch); return;
    case '0':
      input_.consumeDigit(ch); return;
    case 'q': should_quit_ = true; return;
    case ':': mode_ = Mode::Command; cmdline_.clear(); input_.takeCount(); return;
    case '/':
      mode_ = Mode::Search; cmdline_.clear(); input_.takeCount();
      saved_find_ = model_.state().find_text();
      return;
    case 'n': case 'N': {
      size_t k = input_.takeCount(); if (k == 0) k = 1;
      while (k--) search_next(ch == 'n', false);
    } return;
    default: break;
  }
  if (key.code == KeyCode::Tab) { toggle_focus(); input_.takeCount(); return; }
  if (key.code == KeyCode::Esc) {
    model_.set_find_text("");
    message_.clear();
    input_.takeCount();
    return;
  }
  if (!focused) { input_.takeCount(); return; }
  switch (ch) {
    case 'j': { size_t n = input_.takeCount(); if (n == 0) n = 1; while (n--) model_.next_if_exist(); } return;
    case 'k': { size_t n = input_.takeCount(); if (n == 0) n = 1; while (n--) model_.previous_if_exist(); } return;
    case 'g':
      if (input_.consumeGg('g')) {
        size_t n = input_.takeCount();
        select_clamped(n == 0 ? 0 : n - 1);
      }
      return;
    case 'G': {
      size_t n = input_.takeCount();
      if (model_.items().empty()) return;
      select_clamped(n == 0 ? model_.items().size() - 1 : n - 1);
    } return;
    default: break;
  }
  input_.takeCount();
  model_.on_key(key);
}

void Viewer::handle_line_input(int ch) {
  KeyEvent key = decode_key(ch);
  switch (key.code) {
    case KeyCode::Esc:
      if (mode_ == Mode::Search) model_.set_find_text(saved_find_);
      mode_ = Mode::Normal;
      cmdline_.clear();
      return;
    case KeyCode::Backspace:
      if (cmdline_.empty()) {
        if (mode_ == Mode::Search) model_.set_find_text(saved_find_);
        mode_ = Mode::Normal;
        return;
      }
      cmdline_.pop_back();
      break;
    case KeyCode::Enter: {
      std::string line = cmdline_;
      Mode m = mode_;
      mode_ = Mode::Normal;
      cmdline_.clear();
      if (m == Mode::Command) { execute_command(line); return; }
      model_.set_find_text(line);
      if (line.empty()) { message_.clear(); return; }
      size_t hits = count_matches();
      if (hits == 0) { message_ = "pattern not found: " + line; return; }
      search_next(true, true);
      message_ = "matches: " + std::to_string(hits);
      return;
    }
    case KeyCode::Char:
      if (key.mods == KeyMod::None) cmdline_.push_back(static_cast<char>(key.ch));
      break;
    default:
      return;
  }
  // live preview of the query while typing
  if (mode_ == Mode::Search) model_.set_find_text(cmdline_);
}

void Viewer::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set") {
    if (args.empty()) { message_ = "set: missing option"; return; }
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry_.execute(composite, subargs)) { message_ = "unknown option: " + name; }
    return;
  }
  if (!registry_.execute(cmd, args)) { message_ = "unknown command: " + cmd; }
}

void Viewer::load_rc(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { message_ = msg; return; }
  for (std::string s : lines) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute_command(s);
  }
}

LogListItem Viewer::make_item(const std::string& raw) const {
  std::string content = expand_tabs(raw, tab_width_);
  Style style = level_color_ ? level_style(detect_level(content)) : Style{};
  return LogListItem(std::move(content), style);
}

bool Viewer::append_file(const std::filesystem::path& path) {
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { message_ = msg; return false; }
  for (const auto& l : lines) model_.push(make_item(l));
  raw_lines_.insert(raw_lines_.end(), std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end()));
  source_ = source_.empty() ? path.string() : source_ + ", " + path.string();
  message_ = msg;
  return true;
}

bool Viewer::open_file(const std::filesystem::path& path) {
  // validate first so a bad path keeps the current contents
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) { message_ = "can not open file: " + path.string(); return false; }
  model_.clear();
  raw_lines_.clear();
  source_.clear();
  return append_file(path);
}

void Viewer::rebuild_items() {
  std::vector<LogListItem> items;
  items.reserve(raw_lines_.size());
  for (const auto& l : raw_lines_) items.push_back(make_item(l));
  model_.replace_items(std::move(items));
}

void Viewer::toggle_focus() {
  if (model_.state().focused()) model_.blur(); else model_.focus();
}

void Viewer::select_clamped(size_t index) {
  if (model_.items().empty()) return;
  model_.select(std::min(index, model_.items().size() - 1));
}

size_t Viewer::count_matches() const {
  const std::string& q = model_.state().find_text();
  if (q.empty()) return 0;
  size_t n = 0;
  for (const auto& item : model_.items()) if (contains(item.content(), q)) n++;
  return n;
}

void Viewer::search_next(bool forward, bool include_current) {
  const std::string& q = model_.state().find_text();
  if (q.empty()) { message_ = "no last search"; return; }
  const auto& items = model_.items();
  if (items.empty()) { message_ = "pattern not found: " + q; return; }
  size_t cur = std::min(model_.state().selected().value_or(0), items.size() - 1);
  if (forward) {
    for (size_t i = include_current ? cur : cur + 1; i < items.size(); ++i) {
      if (contains(items[i].content(), q)) { model_.select(i); return; }
    }
  } else {
    for (size_t i = include_current ? cur + 1 : cur; i-- > 0;) {
      if (contains(items[i].content(), q)) { model_.select(i); return; }
    }
  }
  message_ = "pattern not found: " + q;
}
