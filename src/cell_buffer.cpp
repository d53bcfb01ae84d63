#include "cell_buffer.hpp"
#include <algorithm>
#include "utf8.hpp"

CellBuffer::CellBuffer(const Rect& area) { resize(area); }

void CellBuffer::resize(const Rect& area) {
  area_ = area;
  if (area_.width < 0) area_.width = 0;
  if (area_.height < 0) area_.height = 0;
  cells_.assign(static_cast<size_t>(area_.width) * static_cast<size_t>(area_.height), Cell{});
}

void CellBuffer::reset() {
  for (auto& c : cells_) c = Cell{};
}

size_t CellBuffer::index_of(int x, int y) const {
  return static_cast<size_t>(y - area_.y) * static_cast<size_t>(area_.width) + static_cast<size_t>(x - area_.x);
}

bool CellBuffer::contains(int x, int y) const {
  return x >= area_.left() && x < area_.right() && y >= area_.top() && y < area_.bottom();
}

Cell& CellBuffer::at(int x, int y) { return cells_[index_of(x, y)]; }
const Cell& CellBuffer::at(int x, int y) const { return cells_[index_of(x, y)]; }

void CellBuffer::set_style(const Rect& r, const Style& style) {
  Rect clip = r.intersection(area_);
  for (int y = clip.top(); y < clip.bottom(); ++y)
    for (int x = clip.left(); x < clip.right(); ++x)
      at(x, y).style = at(x, y).style.patch(style);
}

int CellBuffer::set_string(int x, int y, std::string_view text, int max_width, const Style& style) {
  if (y < area_.top() || y >= area_.bottom()) return x;
  int limit = std::min(area_.right(), x + std::max(0, max_width));
  const int start = x;
  size_t i = 0;
  while (i < text.size() && x < limit) {
    size_t n = utf8_next(text, i);
    int w = utf8_width(text, i, n);
    if (w == 0) {
      // combining mark: joins the code point drawn before it
      if (x > start && x - 1 >= area_.left()) at(x - 1, y).symbol.append(text.substr(i, n));
      i += n;
      continue;
    }
    if (x + w > limit) break;
    for (int k = 0; k < w; ++k) {
      if (x + k < area_.left()) continue;
      Cell& c = at(x + k, y);
      // the columns after a wide code point are left empty; the terminal fills them
      if (k == 0) c.symbol.assign(text.substr(i, n)); else c.symbol.clear();
      c.style = c.style.patch(style);
    }
    i += n;
    x += w;
  }
  return x;
}

int CellBuffer::set_spans(int x, int y, const DisplayLine& line, int max_width) {
  int remaining = max_width;
  for (const auto& sp : line.spans) {
    if (remaining <= 0) break;
    int nx = set_string(x, y, sp.text, remaining, sp.style);
    remaining -= nx - x;
    x = nx;
    if (nx >= area_.right()) break;
  }
  return x;
}

std::string CellBuffer::row_text(int y) const {
  std::string s;
  if (y < area_.top() || y >= area_.bottom()) return s;
  for (int x = area_.left(); x < area_.right(); ++x) s += at(x, y).symbol;
  return s;
}
