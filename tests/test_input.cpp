#include "input.hpp"
#include <ncurses.h>
#include <cassert>

static void test_decode_key() {
  assert(decode_key(KEY_UP) == key_code(KeyCode::Up));
  assert(decode_key(KEY_DOWN) == key_code(KeyCode::Down));
  assert(decode_key(KEY_PPAGE) == key_code(KeyCode::PageUp));
  assert(decode_key(KEY_NPAGE) == key_code(KeyCode::PageDown));
  assert(decode_key('\n') == key_code(KeyCode::Enter));
  assert(decode_key('\r') == key_code(KeyCode::Enter));
  assert(decode_key(KEY_ENTER) == key_code(KeyCode::Enter));
  assert(decode_key(127) == key_code(KeyCode::Backspace));
  assert(decode_key(KEY_BACKSPACE) == key_code(KeyCode::Backspace));
  assert(decode_key('\t') == key_code(KeyCode::Tab));
  assert(decode_key(27) == key_code(KeyCode::Esc));
  // Ctrl-N / Ctrl-P
  assert(decode_key(14) == key_char(U'n', KeyMod::Ctrl));
  assert(decode_key(16) == key_char(U'p', KeyMod::Ctrl));
  assert(decode_key('j') == key_char(U'j'));
  assert(decode_key(' ') == key_char(U' '));
  assert(decode_key(KEY_F(1)).code == KeyCode::Unknown);
  assert(decode_key(200).code == KeyCode::Unknown);
}

static void test_counts() {
  Input in;
  assert(!in.hasCount());
  assert(!in.consumeDigit('0'));
  assert(in.consumeDigit('1'));
  assert(in.consumeDigit('0'));
  assert(in.consumeDigit('5'));
  assert(in.hasCount());
  assert(in.takeCount() == 105);
  assert(!in.hasCount());
  assert(in.takeCount() == 0);
  assert(!in.consumeDigit('x'));
}

static void test_gg() {
  Input in;
  assert(!in.consumeGg('g'));
  assert(in.consumeGg('g'));
  assert(!in.consumeGg('g'));
  in.reset();
  assert(!in.consumeGg('g'));
  assert(!in.consumeGg('j'));
}

int main() {
  test_decode_key();
  test_counts();
  test_gg();
  return 0;
}
