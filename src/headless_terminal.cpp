#include "headless_terminal.hpp"
#include "text_util.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
    : rows_(rows), cols_(cols), cells_(static_cast<size_t>(rows * cols)) {}

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = Cell{};
}

void HeadlessTerminal::set_cell(int row, int col, char32_t ch, const Style& style) {
  if (row < 0 || col < 0 || row >= rows_ || col >= cols_) return;
  cells_[static_cast<size_t>(row * cols_ + col)] = Cell{ch, style};
}

void HeadlessTerminal::set_cursor(int row, int col) {
  cursor_row_ = row;
  cursor_col_ = col;
  cursor_visible_ = true;
}

Event HeadlessTerminal::poll_event() {
  if (events_.empty()) return key_event(Key::Esc);
  Event ev = events_.front();
  events_.pop_front();
  return ev;
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  cells_.assign(static_cast<size_t>(rows * cols), Cell{});
  events_.push_back(resize_event());
}

void HeadlessTerminal::push_text(const std::string& text) {
  for (char32_t c : utf8_decode(text)) {
    if (c == U' ') push_event(key_event(Key::Space));
    else push_event(char_event(c));
  }
}

const HeadlessTerminal::Cell& HeadlessTerminal::cell(int row, int col) const {
  static const Cell blank{};
  if (row < 0 || col < 0 || row >= rows_ || col >= cols_) return blank;
  return cells_[static_cast<size_t>(row * cols_ + col)];
}

std::string HeadlessTerminal::text(int row, int col, int len) const {
  std::u32string s;
  int end = len < 0 ? cols_ : std::min(cols_, col + len);
  for (int c = col; c < end; ++c) s.push_back(cell(row, c).ch);
  return utf8_encode(s);
}

std::string HeadlessTerminal::line(int row) const {
  std::string s = text(row);
  size_t e = s.find_last_not_of(' ');
  return e == std::string::npos ? std::string() : s.substr(0, e + 1);
}
