#pragma once
#include <cstddef>
#include <cstdint>
/*
 * Input
 *
 * Purpose: decode raw curses key codes into logical key events, and parse
 *          Normal mode count prefixes / the gg double key with minimal state.
 * Extend: widgets match on KeyEvent only; they never see curses codes.
 */

enum class KeyCode { Unknown, Char, Up, Down, Left, Right, Home, End, PageUp, PageDown, Enter, Esc, Backspace, Tab };

namespace KeyMod {
  constexpr std::uint8_t None = 0;
  constexpr std::uint8_t Ctrl = 1 << 0;
}

struct KeyEvent {
  KeyCode code = KeyCode::Unknown;
  char32_t ch = 0;
  std::uint8_t mods = KeyMod::None;
  bool operator==(const KeyEvent& o) const = default;
};

inline KeyEvent key_char(char32_t c, std::uint8_t mods = KeyMod::None) { return KeyEvent{KeyCode::Char, c, mods}; }
inline KeyEvent key_code(KeyCode k, std::uint8_t mods = KeyMod::None) { return KeyEvent{k, 0, mods}; }

KeyEvent decode_key(int ch);

class Input {
public:
  bool consumeGg(int ch);
  bool consumeDigit(int ch);
  bool hasCount() const;
  size_t takeCount();
  void reset();
private:
  bool pending_g_ = false;
  size_t pending_count_ = 0;
};
