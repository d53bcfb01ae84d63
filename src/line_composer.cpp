#include "line_composer.hpp"
#include <algorithm>
#include "text_search.hpp"
#include "utf8.hpp"

std::string DisplayLine::text() const {
  std::string s;
  for (const auto& sp : spans) s += sp.text;
  return s;
}

size_t DisplayLine::cells() const {
  size_t n = 0;
  for (const auto& sp : spans) n += utf8_cells(sp.text);
  return n;
}

// Wraps text[seg_b, seg_e), which holds no '\n'. Always emits at least one row.
static void wrap_segment(std::string_view text, size_t seg_b, size_t seg_e, size_t width,
                         std::vector<WrappedRow>& rows) {
  size_t row_b = seg_b, row_e = seg_b, cells = 0;
  bool row_has_word = false;
  size_t i = seg_b;
  while (i < seg_e) {
    size_t sp = i;
    while (i < seg_e && text[i] == ' ') ++i;
    size_t ns = i - sp;
    if (i >= seg_e) {
      // trailing blanks: keep the ones that still fit on the row
      size_t keep = cells < width ? std::min(ns, width - cells) : 0;
      row_e = sp + keep;
      cells += keep;
      break;
    }
    size_t wb = i;
    while (i < seg_e && text[i] != ' ') ++i;
    size_t we = i;
    size_t ww = utf8_cells(text.substr(wb, we - wb));

    if (row_has_word) {
      if (cells + ns + ww <= width) { row_e = we; cells += ns + ww; continue; }
      rows.push_back({row_b, row_e}); // blanks at the break are dropped
    } else if (ns + ww <= width) {
      // first word of the segment keeps its indentation
      row_e = we; cells = ns + ww; row_has_word = true;
      continue;
    }

    size_t p = wb;
    while (ww > width) {
      // fill one row; a code point wider than the row still takes it alone
      size_t q = p, cw = 0;
      while (q < we) {
        size_t n = utf8_next(text, q);
        size_t w = static_cast<size_t>(utf8_width(text, q, n));
        if (cw + w > width && q > p) break;
        cw += w;
        q += n;
      }
      // the rest is a single code point wider than the row: it becomes the open row
      if (q == we) break;
      rows.push_back({p, q});
      ww -= cw;
      p = q;
    }
    row_b = p; row_e = we; cells = ww; row_has_word = true;
  }
  rows.push_back({row_b, row_e});
}

std::vector<WrappedRow> wrap_rows(std::string_view text, int width) {
  std::vector<WrappedRow> rows;
  if (width <= 0) return rows;
  size_t b = 0;
  while (true) {
    size_t nl = text.find('\n', b);
    size_t e = (nl == std::string_view::npos) ? text.size() : nl;
    if (e > b && text[e - 1] == '\r') --e;
    wrap_segment(text, b, e, static_cast<size_t>(width), rows);
    if (nl == std::string_view::npos) break;
    b = nl + 1;
  }
  return rows;
}

std::vector<DisplayLine> compose(std::string_view text, int width, std::string_view query,
                                 const Style& base, const Style& match) {
  std::vector<DisplayLine> out;
  auto rows = wrap_rows(text, width);
  out.reserve(rows.size());
  std::vector<size_t> hits = find_all(text, query);
  const Style hit_style = base.patch(match);
  const size_t qlen = query.size();
  size_t m = 0;
  for (const auto& row : rows) {
    DisplayLine line;
    while (m < hits.size() && hits[m] + qlen <= row.begin) ++m;
    size_t pos = row.begin;
    for (size_t k = m; k < hits.size() && hits[k] < row.end; ++k) {
      size_t mb = std::max(hits[k], row.begin);
      size_t me = std::min(hits[k] + qlen, row.end);
      if (mb > pos) line.spans.push_back({std::string(text.substr(pos, mb - pos)), base});
      if (me > mb) line.spans.push_back({std::string(text.substr(mb, me - mb)), hit_style});
      pos = std::max(pos, me);
    }
    if (pos < row.end) line.spans.push_back({std::string(text.substr(pos, row.end - pos)), base});
    out.push_back(std::move(line));
  }
  return out;
}

size_t line_height(std::string_view text, int width) {
  return wrap_rows(text, width).size();
}
