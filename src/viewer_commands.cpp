#include "viewer.hpp"
#include <algorithm>
#include <string>

static bool parse_on_off(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

static bool parse_index(const std::string& s, size_t& out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return c >= '0' && c <= '9'; })) return false;
  if (s.size() > 9) return false;
  out = static_cast<size_t>(std::stoul(s));
  return true;
}

void Viewer::register_commands() {
  registry_.register_command("q", [this](const std::vector<std::string>&){ should_quit_ = true; });
  registry_.register_alias("quit", "q");
  registry_.register_command("e", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "e: use :e <path>"; return; }
    open_file(args[0]);
  });
  registry_.register_alias("open", "e");
  registry_.register_command("clear", [this](const std::vector<std::string>&){
    model_.clear();
    raw_lines_.clear();
    source_.clear();
    message_ = "cleared";
  });
  registry_.register_command("find", [this](const std::vector<std::string>& args){
    std::string q;
    for (size_t i = 0; i < args.size(); ++i) { if (i) q += ' '; q += args[i]; }
    model_.set_find_text(q);
    if (q.empty()) { message_.clear(); return; }
    size_t hits = count_matches();
    if (hits == 0) { message_ = "pattern not found: " + q; return; }
    search_next(true, true);
    message_ = "matches: " + std::to_string(hits);
  });
  registry_.register_command("noh", [this](const std::vector<std::string>&){ model_.set_find_text(""); });
  registry_.register_command("select", [this](const std::vector<std::string>& args){
    size_t n = 0;
    if (args.empty() || !parse_index(args[0], n) || n == 0) { message_ = "select: use :select <line number>"; return; }
    if (model_.items().empty()) { message_ = "select: list is empty"; return; }
    select_clamped(n - 1);
  });
  registry_.register_command("unselect", [this](const std::vector<std::string>&){ model_.unselect(); });
  registry_.register_command("focus", [this](const std::vector<std::string>&){ model_.focus(); });
  registry_.register_command("blur", [this](const std::vector<std::string>&){ model_.blur(); });

  registry_.register_command("set tabstop", [this](const std::vector<std::string>& args){
    size_t n = 0;
    if (args.empty() || !parse_index(args[0], n) || n < 1 || n > KANTEN_MAX_TABSTOP) {
      message_ = "set tabstop: use :set tabstop 1.." + std::to_string(KANTEN_MAX_TABSTOP);
      return;
    }
    tab_width_ = static_cast<int>(n);
    rebuild_items();
    message_ = "tabstop=" + std::to_string(tab_width_);
  });
  registry_.register_alias("set ts", "set tabstop");
  registry_.register_command("set levelcolor", [this](const std::vector<std::string>& args){
    bool v = level_color_;
    if (!parse_on_off(args, level_color_, v)) { message_ = "set levelcolor: use :set levelcolor on|off"; return; }
    level_color_ = v;
    rebuild_items();
    message_ = level_color_ ? "levelcolor on" : "levelcolor off";
  });

  auto color_option = [this](const std::string& name, Color Viewer::* field) {
    registry_.register_command("set " + name, [this, name, field](const std::vector<std::string>& args){
      Color c = Color::Default;
      if (args.empty() || !parse_color(args[0], c)) { message_ = "set " + name + ": unknown color"; return; }
      this->*field = c;
      message_ = name + "=" + color_name(c);
    });
  };
  color_option("highlight", &Viewer::highlight_bg_);
  color_option("selected", &Viewer::selected_bg_);
  color_option("match", &Viewer::match_bg_);
}
