#pragma once
/*
 * LineComposer
 *
 * Purpose: turn one log entry into wrapped display lines with search-match spans.
 * Rules: greedy word wrap at `width` cells, words longer than `width` are
 *        hard-broken, '\n' forces a line break, empty text gives one empty line.
 * Constraint: pure; height() ignores the query so scroll geometry never
 *             depends on what is being searched.
 */
#include <string>
#include <string_view>
#include <vector>
#include "style.hpp"

struct Span {
  std::string text;
  Style style;
  bool operator==(const Span& o) const = default;
};

struct DisplayLine {
  std::vector<Span> spans;
  std::string text() const;
  size_t cells() const;
};

// Byte range [begin, end) of `text` that forms one wrapped row.
struct WrappedRow {
  size_t begin = 0;
  size_t end = 0;
};

std::vector<WrappedRow> wrap_rows(std::string_view text, int width);

std::vector<DisplayLine> compose(std::string_view text, int width, std::string_view query,
                                 const Style& base = Style{}, const Style& match = Style{});

size_t line_height(std::string_view text, int width);
