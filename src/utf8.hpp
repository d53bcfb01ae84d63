#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: step over code points and measure them in terminal columns so
 *          wrapping and cell writes never split a sequence.
 * Note: widths come from wcwidth() in the current LC_CTYPE locale; wide
 *       (CJK) code points take two columns, combining marks none. Malformed
 *       bytes and code points wcwidth() rejects take one column each.
 */
#include <cstddef>
#include <string_view>
#include <wchar.h>

inline size_t utf8_seq_len(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

// Byte length of the code point starting at s[i], clamped to the end of s.
inline size_t utf8_next(std::string_view s, size_t i) {
  size_t n = utf8_seq_len(static_cast<unsigned char>(s[i]));
  if (i + n > s.size()) n = s.size() - i;
  for (size_t k = 1; k < n; ++k) {
    if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return k;
  }
  return n;
}

// Columns taken by the code point s[i, i + n), n as returned by utf8_next.
inline int utf8_width(std::string_view s, size_t i, size_t n) {
  unsigned char lead = static_cast<unsigned char>(s[i]);
  if (lead < 0x80) return 1;
  if (n < 2 || n != utf8_seq_len(lead)) return 1;
  char32_t cp = lead & (0x7F >> n);
  for (size_t k = 1; k < n; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  return w < 0 ? 1 : w;
}

inline size_t utf8_cells(std::string_view s) {
  size_t cells = 0;
  for (size_t i = 0; i < s.size();) {
    size_t n = utf8_next(s, i);
    cells += static_cast<size_t>(utf8_width(s, i, n));
    i += n;
  }
  return cells;
}
