#pragma once
/*
 * Style
 *
 * Purpose: terminal-independent cell style (fg/bg color + modifier set).
 * Note: patch() layers one style on top of another; unset fields fall through.
 */
#include <cstdint>
#include <optional>
#include <string>

enum class Color : std::uint8_t { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

namespace Modifier {
  constexpr std::uint16_t None      = 0;
  constexpr std::uint16_t Bold      = 1 << 0;
  constexpr std::uint16_t Dim       = 1 << 1;
  constexpr std::uint16_t Underline = 1 << 2;
  constexpr std::uint16_t Reverse   = 1 << 3;
}

struct Style {
  std::optional<Color> fg;
  std::optional<Color> bg;
  std::uint16_t add_modifier = Modifier::None;
  std::uint16_t sub_modifier = Modifier::None;

  Style& with_fg(Color c) { fg = c; return *this; }
  Style& with_bg(Color c) { bg = c; return *this; }
  Style& add(std::uint16_t m) { add_modifier |= m; sub_modifier &= static_cast<std::uint16_t>(~m); return *this; }
  Style& remove(std::uint16_t m) { sub_modifier |= m; add_modifier &= static_cast<std::uint16_t>(~m); return *this; }

  Style patch(const Style& other) const;
  bool operator==(const Style& other) const = default;
};

bool parse_color(const std::string& name, Color& out);
const char* color_name(Color c);
