#include "log_list.hpp"
#include "log_list_view.hpp"
#include "cell_buffer.hpp"
#include "line_composer.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

struct BenchCfg {
  int N = 200000;          // entries in the list
  int width = 120;         // viewport columns
  int height = 50;         // viewport rows
  int jump_iters = 2000;   // random select + render
  int step_iters = 20000;  // j-style step + render
  int compose_iters = 200000;
};

static std::string make_entry(std::mt19937& rng, int i) {
  static const char* words[] = {"INFO", "request", "served", "in", "12ms", "ERROR", "connection",
                                "reset", "by", "peer", "retrying", "upstream=10.0.0.7:8080"};
  std::string s = "2024-05-01T10:00:" + std::to_string(i % 60) + "Z";
  int n = 4 + static_cast<int>(rng() % 40);
  for (int k = 0; k < n; ++k) { s += ' '; s += words[rng() % 12]; }
  return s;
}

static LogListModel make_model(const BenchCfg& cfg) {
  std::mt19937 rng(1);
  LogListModel m;
  for (int i = 0; i < cfg.N; ++i) m.push(LogListItem(make_entry(rng, i)));
  return m;
}

static double seconds_since(std::chrono::steady_clock::time_point t0) {
  std::chrono::duration<double> dt = std::chrono::steady_clock::now() - t0;
  return dt.count();
}

static void bench_compose(const BenchCfg& cfg) {
  std::mt19937 rng(2);
  std::vector<std::string> entries;
  for (int i = 0; i < 1000; ++i) entries.push_back(make_entry(rng, i));
  size_t rows = 0;
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.compose_iters; ++i) rows += compose(entries[i % 1000], cfg.width, "ERROR").size();
  std::cout << "[compose]  " << cfg.compose_iters << " entries -> " << rows << " rows took " << seconds_since(t0) << "s\n";
}

static void bench_jumps(const BenchCfg& cfg, LogListModel& m) {
  std::mt19937 rng(3);
  CellBuffer buf(Rect{0, 0, cfg.width, cfg.height});
  LogListView view(m.items(), LogListConfig{});
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.jump_iters; ++i) {
    m.select(rng() % static_cast<unsigned>(cfg.N));
    buf.reset();
    view.render(buf.area(), buf, m.state());
  }
  std::cout << "[jump]     " << cfg.jump_iters << " random selects took " << seconds_since(t0) << "s\n";
}

static void bench_steps(const BenchCfg& cfg, LogListModel& m) {
  CellBuffer buf(Rect{0, 0, cfg.width, cfg.height});
  LogListView view(m.items(), LogListConfig{});
  m.select(0);
  m.set_find_text("ERROR");
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.step_iters; ++i) {
    m.next_if_exist();
    buf.reset();
    view.render(buf.area(), buf, m.state());
  }
  std::cout << "[step]     " << cfg.step_iters << " steps (with highlight) took " << seconds_since(t0)
            << "s, offset=" << m.state().offset() << "\n";
}

int main() {
  BenchCfg cfg;
  auto t0 = std::chrono::steady_clock::now();
  LogListModel m = make_model(cfg);
  std::cout << "[build]    N=" << cfg.N << " took " << seconds_since(t0) << "s\n";
  bench_compose(cfg);
  bench_jumps(cfg, m);
  bench_steps(cfg, m);
  return 0;
}
