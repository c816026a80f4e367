#pragma once
/*
 * Window
 *
 * Purpose: rectangular, cell-addressed view onto the terminal surface.
 * Note: coordinates passed to print are relative to the window origin;
 *       anything outside the rectangle is clipped silently.
 */
#include <string>
#include "iterminal.hpp"
#include "pane_layout.hpp"
#include "types.hpp"

class Window {
public:
  Window() = default;
  Window(ITerminal& term, const Rect& rect, int tabstop = 8);

  void renew(const Rect& rect) { rect_ = rect; }
  void set_tabstop(int tabstop) { tabstop_ = tabstop > 0 ? tabstop : 1; }

  const Rect& rect() const { return rect_; }
  int width() const { return rect_.width; }
  int height() const { return rect_.height; }
  int x() const { return rect_.col; }
  int y() const { return rect_.row; }

  // Returns the column just past the last cell written (or skipped by a tab).
  int print(int x, int y, const Style& style, const std::string& text) const;
  // Same as print, padding with blanks to the right edge.
  void printl(int x, int y, const Style& style, const std::string& text) const;

private:
  ITerminal* term_ = nullptr;
  Rect rect_{};
  int tabstop_ = 8;
};
