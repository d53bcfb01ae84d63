#include "input.hpp"
#include <ncurses.h>

static constexpr int ESC = 27;

KeyEvent decode_key(int ch) {
  switch (ch) {
    case KEY_UP: return key_code(KeyCode::Up);
    case KEY_DOWN: return key_code(KeyCode::Down);
    case KEY_LEFT: return key_code(KeyCode::Left);
    case KEY_RIGHT: return key_code(KeyCode::Right);
    case KEY_HOME: return key_code(KeyCode::Home);
    case KEY_END: return key_code(KeyCode::End);
    case KEY_PPAGE: return key_code(KeyCode::PageUp);
    case KEY_NPAGE: return key_code(KeyCode::PageDown);
    case KEY_ENTER: case '\n': case '\r': return key_code(KeyCode::Enter);
    case KEY_BACKSPACE: case 127: case 8: return key_code(KeyCode::Backspace);
    case '\t': return key_code(KeyCode::Tab);
    case ESC: return key_code(KeyCode::Esc);
    default: break;
  }
  // Ctrl-A .. Ctrl-Z arrive as 1..26
  if (ch >= 1 && ch <= 26) return key_char(static_cast<char32_t>('a' + ch - 1), KeyMod::Ctrl);
  if (ch >= 32 && ch <= 126) return key_char(static_cast<char32_t>(ch));
  return KeyEvent{};
}

bool Input::consumeGg(int ch) {
  if (ch == 'g') {
    if (pending_g_) { pending_g_ = false; return true; }
    pending_g_ = true; return false;
  }
  return false;
}

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0') {
    if (pending_count_ > 0) {
      pending_count_ = pending_count_ * 10;
      return true;
    }
  }
  return false;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

size_t Input::takeCount() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_g_ = false;
}
