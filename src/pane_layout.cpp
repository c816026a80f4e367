#include "pane_layout.hpp"
#include <algorithm>
#include <cstdint>
#include <numeric>

std::vector<int> pane_widths(int total, const std::vector<int>& ratios) {
  std::vector<int> widths(ratios.size(), 0);
  if (ratios.empty()) return widths;
  total = std::max(0, total);
  std::int64_t rsum = std::accumulate(ratios.begin(), ratios.end(), std::int64_t{0});
  int unit = rsum > 0 ? static_cast<int>(total / rsum) : 0;
  int wsum = 0;
  for (size_t i = 0; i + 1 < ratios.size(); ++i) {
    widths[i] = ratios[i] * unit;
    wsum += widths[i];
  }
  widths.back() = total - wsum;
  return widths;
}

std::vector<Rect> pane_rects(int cols, int rows, const std::vector<int>& ratios) {
  std::vector<int> widths = pane_widths(cols, ratios);
  std::vector<Rect> out;
  out.reserve(widths.size());
  int height = std::max(0, rows - 2);
  int acc = 0;
  for (int w : widths) {
    out.push_back(Rect{1, acc, height, w});
    acc += w;
  }
  return out;
}
