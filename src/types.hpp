#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Rect).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <algorithm>

enum class Mode { Normal, Command, Search };

struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  int left() const { return x; }
  int top() const { return y; }
  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool empty() const { return width <= 0 || height <= 0; }

  Rect intersection(const Rect& o) const {
    int x0 = std::max(x, o.x), y0 = std::max(y, o.y);
    int x1 = std::min(right(), o.right()), y1 = std::min(bottom(), o.bottom());
    if (x1 <= x0 || y1 <= y0) return Rect{x0, y0, 0, 0};
    return Rect{x0, y0, x1 - x0, y1 - y0};
  }
  bool operator==(const Rect& o) const = default;
};
