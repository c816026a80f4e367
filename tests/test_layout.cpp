#include "pane_layout.hpp"
#include <cassert>
#include <numeric>
#include <vector>

static int sum(const std::vector<int>& v) { return std::accumulate(v.begin(), v.end(), 0); }

static void test_example_ratios() {
  std::vector<int> w = pane_widths(80, {1, 1, 2});
  assert((w == std::vector<int>{20, 20, 40}));
}

static void test_widths_always_partition() {
  const std::vector<std::vector<int>> ratio_sets = {{1}, {1, 2, 3}, {1, 1, 2}, {3, 5}, {1, 1, 1, 1, 1, 1, 1}, {7, 2, 9, 4}};
  for (const auto& ratios : ratio_sets) {
    for (int total = 0; total <= 300; ++total) {
      std::vector<int> w = pane_widths(total, ratios);
      assert(w.size() == ratios.size());
      assert(sum(w) == total);
      for (int x : w) assert(x >= 0);
    }
  }
}

static void test_last_pane_absorbs_remainder() {
  // unit = 81 / 6 = 13
  std::vector<int> w = pane_widths(81, {1, 2, 3});
  assert(w[0] == 13);
  assert(w[1] == 26);
  assert(w[2] == 42);
}

static void test_degenerate() {
  assert(pane_widths(80, {}).empty());
  std::vector<int> w = pane_widths(2, {1, 1, 1});
  assert(w.size() == 3);
  assert(w[0] == 0 && w[1] == 0 && w[2] == 2);
}

static void test_huge_ratios_do_not_overflow() {
  std::vector<int> w = pane_widths(80, {2000000000, 2000000000, 2000000000});
  assert((w == std::vector<int>{0, 0, 80}));
  w = pane_widths(100, {1, 1000000000});
  assert(sum(w) == 100);
  assert(w[0] == 0);
}

static void test_rects_tile_the_screen() {
  std::vector<Rect> rs = pane_rects(80, 24, {1, 2, 3});
  assert(rs.size() == 3);
  int col = 0;
  for (const auto& r : rs) {
    assert(r.row == 1);
    assert(r.height == 22);
    assert(r.col == col);
    col += r.width;
  }
  assert(col == 80);
  std::vector<Rect> tiny = pane_rects(10, 1, {1, 1});
  assert(tiny[0].height == 0);
}

int main() {
  test_example_ratios();
  test_widths_always_partition();
  test_last_pane_absorbs_remainder();
  test_degenerate();
  test_huge_ratios_do_not_overflow();
  test_rects_tile_the_screen();
  return 0;
}
