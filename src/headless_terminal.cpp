#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows < 0 ? 0 : rows;
  cols_ = cols < 0 ? 0 : cols;
  cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), " ");
  styles_.assign(cells_.size(), Style{});
}

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = " ";
  for (auto& s : styles_) s = Style{};
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text, const Style& style) {
  if (row < 0 || row >= rows_) return;
  const size_t base = static_cast<size_t>(row) * static_cast<size_t>(cols_);
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t n = utf8_next(text, i);
    int w = utf8_width(text, i, n);
    if (w == 0) {
      if (col > 0) cells_[base + static_cast<size_t>(col - 1)] += text.substr(i, n);
      i += n;
      continue;
    }
    // a wide code point owns the next column too, recorded as an empty cell
    for (int k = 0; k < w && col + k < cols_; ++k) {
      if (col + k < 0) continue;
      size_t idx = base + static_cast<size_t>(col + k);
      if (k == 0) cells_[idx] = text.substr(i, n); else cells_[idx].clear();
      styles_[idx] = style;
    }
    i += n;
    col += w;
  }
}

std::string HeadlessTerminal::row(int r) const {
  std::string s;
  if (r < 0 || r >= rows_) return s;
  for (int c = 0; c < cols_; ++c) s += cells_[static_cast<size_t>(r) * static_cast<size_t>(cols_) + static_cast<size_t>(c)];
  return s;
}

const Style& HeadlessTerminal::style_at(int r, int c) const {
  return styles_[static_cast<size_t>(r) * static_cast<size_t>(cols_) + static_cast<size_t>(c)];
}
