#pragma once
/*
 * CellBuffer
 *
 * Purpose: off-screen grid of styled cells that widgets draw into.
 * Note: every write is clipped to the buffer area; cells outside the
 *       written range keep their content and style. A wide code point fills
 *       its first cell and leaves the next one with an empty symbol.
 */
#include <string>
#include <string_view>
#include <vector>
#include "style.hpp"
#include "types.hpp"
#include "line_composer.hpp"

struct Cell {
  std::string symbol = " ";
  Style style;
  bool operator==(const Cell& o) const = default;
};

class CellBuffer {
public:
  explicit CellBuffer(const Rect& area);

  const Rect& area() const { return area_; }
  void resize(const Rect& area);
  void reset();

  Cell& at(int x, int y);
  const Cell& at(int x, int y) const;
  bool contains(int x, int y) const;

  void set_style(const Rect& r, const Style& style);
  int set_spans(int x, int y, const DisplayLine& line, int max_width);
  int set_string(int x, int y, std::string_view text, int max_width, const Style& style);

  // Symbols of row y joined, for tests and debugging.
  std::string row_text(int y) const;

private:
  Rect area_;
  std::vector<Cell> cells_;
  size_t index_of(int x, int y) const;
};
