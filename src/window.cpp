#include "window.hpp"
#include "text_util.hpp"
#include <algorithm>

Window::Window(ITerminal& term, const Rect& rect, int tabstop) : term_(&term), rect_(rect) {
  set_tabstop(tabstop);
}

int Window::print(int x, int y, const Style& style, const std::string& text) const {
  if (!term_ || y < 0 || y >= rect_.height) return x;
  const int off = x;
  for (char32_t c : utf8_decode(text)) {
    if (x >= rect_.width) break;
    int next = x + 1;
    if (c == '\t') {
      next = x + tabstop_ - (x - off) % tabstop_;
      c = ' ';
    } else if (!is_print_rune(c)) {
      c = '?';
    }
    for (int cx = x; cx < next && cx < rect_.width; ++cx) {
      if (cx >= 0) term_->set_cell(rect_.row + y, rect_.col + cx, c, style);
    }
    x = next;
  }
  return x;
}

void Window::printl(int x, int y, const Style& style, const std::string& text) const {
  int end = print(x, y, style, text);
  if (!term_ || y < 0 || y >= rect_.height) return;
  for (int cx = std::max(end, 0); cx < rect_.width; ++cx) {
    term_->set_cell(rect_.row + y, rect_.col + cx, ' ', style);
  }
}
