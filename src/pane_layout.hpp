#pragma once
/*
 * PaneLayout
 *
 * Purpose: split the terminal width into panes by a ratio list.
 * Invariant: widths sum to the total; the last pane absorbs the remainder.
 */
#include <vector>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

std::vector<int> pane_widths(int total, const std::vector<int>& ratios);

// Pane rectangles below the path bar and above the status line.
std::vector<Rect> pane_rects(int cols, int rows, const std::vector<int>& ratios);
