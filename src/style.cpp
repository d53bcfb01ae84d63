#include "style.hpp"
#include <algorithm>
#include <cctype>

Style Style::patch(const Style& other) const {
  Style s = *this;
  if (other.fg) s.fg = other.fg;
  if (other.bg) s.bg = other.bg;
  s.add_modifier = static_cast<std::uint16_t>((s.add_modifier & ~other.sub_modifier) | other.add_modifier);
  s.sub_modifier = static_cast<std::uint16_t>((s.sub_modifier & ~other.add_modifier) | other.sub_modifier);
  return s;
}

static const struct { const char* name; Color color; } kColorNames[] = {
  {"default", Color::Default}, {"black", Color::Black}, {"red", Color::Red},
  {"green", Color::Green}, {"yellow", Color::Yellow}, {"blue", Color::Blue},
  {"magenta", Color::Magenta}, {"cyan", Color::Cyan}, {"white", Color::White},
};

bool parse_color(const std::string& name, Color& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  for (const auto& e : kColorNames) {
    if (lower == e.name) { out = e.color; return true; }
  }
  return false;
}

const char* color_name(Color c) {
  for (const auto& e : kColorNames) if (e.color == c) return e.name;
  return "default";
}
