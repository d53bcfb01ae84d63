#include "log_list_view.hpp"
#include "cell_buffer.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static const Style kHighlight = Style{}.with_bg(Color::Blue);
static const Style kMatch = Style{}.with_bg(Color::Yellow);

static LogListConfig config() {
  LogListConfig cfg;
  cfg.highlight_style = kHighlight;
  cfg.match_style = kMatch;
  return cfg;
}

static LogListModel make_model(int n) {
  LogListModel m;
  for (int i = 0; i < n; ++i) m.push(LogListItem("item " + std::to_string(i)));
  return m;
}

// Text that wraps to exactly `rows` rows at `width`.
static std::string tall(int rows, int width, char first = 'a') {
  std::string s;
  for (int r = 0; r < rows; ++r) {
    if (r) s += ' ';
    s += std::string(static_cast<size_t>(width), static_cast<char>('a' + (first - 'a' + r) % 26));
  }
  return s;
}

static void render(LogListModel& m, CellBuffer& buf, const Rect& area) {
  LogListView view(m.items(), config());
  render_widget(view, area, buf, m.state());
}

static bool starts_with(const std::string& s, const std::string& p) { return s.compare(0, p.size(), p) == 0; }

static void test_slide_down_and_up() {
  LogListModel m = make_model(5);
  CellBuffer buf(Rect{0, 0, 20, 3});
  m.select(4);
  render(m, buf, buf.area());
  assert(m.state().offset() == 2);
  assert(starts_with(buf.row_text(0), "item 2"));
  assert(starts_with(buf.row_text(2), "item 4"));

  buf.reset();
  m.select(0);
  render(m, buf, buf.area());
  assert(m.state().offset() == 0);
  assert(starts_with(buf.row_text(0), "item 0"));
}

static void test_offset_is_stable() {
  LogListModel m = make_model(20);
  CellBuffer buf(Rect{0, 0, 20, 5});
  m.select(12);
  render(m, buf, buf.area());
  size_t off = m.state().offset();
  assert(off == 8);
  for (int i = 0; i < 3; ++i) { render(m, buf, buf.area()); assert(m.state().offset() == off); }
  // moving inside the window does not scroll
  m.select(9);
  render(m, buf, buf.area());
  assert(m.state().offset() == off);
  m.previous_if_exist();
  render(m, buf, buf.area());
  assert(m.state().offset() == off);
  m.previous_if_exist();
  render(m, buf, buf.area());
  assert(m.state().offset() == 7);
}

static void test_tall_item_is_clipped() {
  LogListModel m;
  m.push(LogListItem("aaaaaaaaaa bbbbbbbbbb cccccccccc dddddddddd"));
  assert(m.items()[0].height(10) == 4);
  CellBuffer buf(Rect{0, 0, 10, 5});
  for (int x = 0; x < 10; ++x) buf.at(x, 3).symbol = "x";
  Rect area{0, 0, 10, 3};
  render(m, buf, area);
  assert(m.state().offset() == 0);
  assert(buf.row_text(0) == "aaaaaaaaaa");
  assert(buf.row_text(1) == "bbbbbbbbbb");
  assert(buf.row_text(2) == "cccccccccc");
  // rows past the bottom edge are not drawn
  assert(buf.row_text(3) == "xxxxxxxxxx");
  assert(buf.at(0, 2).style == kHighlight);
  assert(buf.at(0, 3).style == Style{});
}

static void test_partial_trailing_item() {
  LogListModel m;
  m.push(LogListItem(tall(1, 8)));
  m.push(LogListItem(tall(3, 8, 'k')));
  m.push(LogListItem(tall(1, 8, 'x')));
  CellBuffer buf(Rect{0, 0, 8, 2});
  m.select(1);
  render(m, buf, buf.area());
  assert(m.state().offset() == 0);
  assert(buf.row_text(0) == "aaaaaaaa");
  assert(buf.row_text(1) == "kkkkkkkk");
  assert(buf.at(0, 1).style == kHighlight);

  buf.reset();
  m.select(2);
  render(m, buf, buf.area());
  assert(m.state().offset() == 2);
  assert(buf.row_text(0) == "xxxxxxxx");
  assert(buf.at(0, 0).style == kHighlight);
}

static void test_selected_taller_than_view() {
  LogListModel m;
  for (int i = 0; i < 3; ++i) m.push(LogListItem(tall(1, 6)));
  m.push(LogListItem(tall(5, 6)));
  CellBuffer buf(Rect{0, 0, 6, 3});
  m.select(3);
  render(m, buf, buf.area());
  assert(m.state().offset() == 3);
  assert(buf.row_text(0) == "aaaaaa");
  assert(buf.row_text(2) == "cccccc");

  buf.reset();
  m.select(0);
  render(m, buf, buf.area());
  assert(m.state().offset() == 0);
}

static void test_degenerate_areas_are_noops() {
  LogListModel m = make_model(10);
  CellBuffer buf(Rect{0, 0, 20, 3});
  m.select(9);
  render(m, buf, buf.area());
  assert(m.state().offset() == 7);

  CellBuffer untouched(Rect{0, 0, 20, 3});
  m.select(0);
  render(m, untouched, Rect{0, 0, 0, 3});
  render(m, untouched, Rect{0, 0, 20, 0});
  assert(m.state().offset() == 7);
  for (int y = 0; y < 3; ++y) assert(untouched.row_text(y) == std::string(20, ' '));

  LogListModel empty;
  empty.select(5);
  render(empty, untouched, untouched.area());
  assert(empty.state().offset() == 0);
  assert(untouched.row_text(0) == std::string(20, ' '));
}

static void test_out_of_range_selection_is_clamped() {
  LogListModel m = make_model(5);
  CellBuffer buf(Rect{0, 0, 20, 3});
  m.select(99);
  render(m, buf, buf.area());
  assert(m.state().offset() == 2);
  assert(*m.state().selected() == 99);
  assert(starts_with(buf.row_text(2), "item 4"));
  assert(buf.at(0, 2).style == kHighlight);
  assert(!(buf.at(0, 1).style == kHighlight));
}

static void test_cells_outside_area_untouched() {
  LogListModel m = make_model(5);
  CellBuffer buf(Rect{0, 0, 12, 6});
  for (int y = 0; y < 6; ++y)
    for (int x = 0; x < 12; ++x) buf.at(x, y).symbol = "#";
  Rect area{2, 1, 8, 3};
  m.select(1);
  render(m, buf, area);
  assert(buf.row_text(0) == std::string(12, '#'));
  assert(buf.row_text(4) == std::string(12, '#'));
  assert(buf.row_text(1) == "##item 0####");
  assert(buf.row_text(2) == "##item 1####");
  assert(buf.at(1, 2).style == Style{});
  assert(buf.at(2, 2).style == kHighlight);
  assert(buf.at(9, 2).style == kHighlight);
  assert(buf.at(10, 2).style == Style{});
}

static void test_unselected_renders_without_highlight() {
  LogListModel m = make_model(3);
  m.unselect();
  CellBuffer buf(Rect{0, 0, 10, 3});
  render(m, buf, buf.area());
  assert(m.state().offset() == 0);
  for (int y = 0; y < 3; ++y) assert(!(buf.at(0, y).style == kHighlight));
}

static void test_match_and_item_styles() {
  LogListModel m;
  Style red; red.with_fg(Color::Red);
  m.push(LogListItem("ok line"));
  m.push(LogListItem("disk error here", red));
  m.select(0);
  m.set_find_text("error");
  CellBuffer buf(Rect{0, 0, 20, 2});
  render(m, buf, buf.area());
  assert(buf.at(0, 1).style == red);
  assert(buf.at(5, 1).style == red.patch(kMatch));
  assert(buf.at(9, 1).style == red.patch(kMatch));
  assert(buf.at(10, 1).style == red);
  // the item style covers the whole row, not just the text
  assert(buf.at(19, 1).style == red);
  assert(buf.at(0, 0).style == kHighlight);
}

static void test_selection_always_visible() {
  std::mt19937 rng(7);
  for (int round = 0; round < 300; ++round) {
    int width = 3 + static_cast<int>(rng() % 10);
    int height = 1 + static_cast<int>(rng() % 8);
    LogListModel m;
    int n = 1 + static_cast<int>(rng() % 30);
    for (int i = 0; i < n; ++i) m.push(LogListItem(tall(1 + static_cast<int>(rng() % 6), width)));
    CellBuffer buf(Rect{0, 0, width, height});
    for (int step = 0; step < 20; ++step) {
      m.select(rng() % static_cast<unsigned>(n));
      render(m, buf, buf.area());
      size_t sel = *m.state().selected();
      size_t off = m.state().offset();
      assert(off <= sel);
      size_t top = 0;
      for (size_t i = off; i < sel; ++i) top += m.items()[i].height(width);
      assert(top < static_cast<size_t>(height));
      assert(buf.at(0, static_cast<int>(top)).style == kHighlight);
    }
  }
}

int main() {
  test_slide_down_and_up();
  test_offset_is_stable();
  test_tall_item_is_clipped();
  test_partial_trailing_item();
  test_selected_taller_than_view();
  test_degenerate_areas_are_noops();
  test_out_of_range_selection_is_clamped();
  test_cells_outside_area_untouched();
  test_unselected_renders_without_highlight();
  test_match_and_item_styles();
  test_selection_always_visible();
  return 0;
}
