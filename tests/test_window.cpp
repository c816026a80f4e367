#include "headless_terminal.hpp"
#include "window.hpp"
#include <cassert>
#include <string>

static void test_print_is_relative_and_clipped() {
  HeadlessTerminal term(5, 20);
  Window win(term, Rect{1, 4, 2, 6});
  int end = win.print(0, 0, Style{}, "abcdefghij");
  assert(end == 6);
  assert(term.text(1, 4, 6) == "abcdef");
  assert(term.cell(1, 10).ch == U' ');
  assert(term.cell(1, 3).ch == U' ');
  win.print(0, 2, Style{}, "outside");
  assert(term.line(3).empty());
  win.print(0, -1, Style{}, "outside");
  assert(term.line(0).empty());
}

static void test_tab_advances_to_next_stop() {
  HeadlessTerminal term(1, 40);
  Window win(term, Rect{0, 0, 1, 40}, 8);
  for (int c = 0; c < 20; ++c) {
    term.clear();
    std::string s(static_cast<size_t>(c), 'x');
    s += "\tY";
    win.print(0, 0, Style{}, s);
    int want = (c / 8 + 1) * 8;
    assert(term.cell(0, want).ch == U'Y');
    for (int k = c; k < want; ++k) assert(term.cell(0, k).ch == U' ');
  }
}

static void test_tab_is_relative_to_start_column() {
  HeadlessTerminal term(1, 40);
  Window win(term, Rect{0, 0, 1, 40}, 4);
  win.print(2, 0, Style{}, "a\tb");
  assert(term.cell(0, 2).ch == U'a');
  assert(term.cell(0, 6).ch == U'b');
}

static void test_printl_pads_with_style() {
  HeadlessTerminal term(2, 10);
  Window win(term, Rect{0, 0, 1, 10});
  win.printl(0, 0, bold(), "ab");
  assert(term.text(0, 0, 2) == "ab");
  for (int c = 2; c < 10; ++c) {
    assert(term.cell(0, c).ch == U' ');
    assert(term.cell(0, c).style == bold());
  }
}

static void test_utf8_one_column_per_code_point() {
  HeadlessTerminal term(1, 10);
  Window win(term, Rect{0, 0, 1, 4});
  int end = win.print(0, 0, Style{}, "h\xC3\xA9llo");
  assert(end == 4);
  assert(term.cell(0, 1).ch == U'é');
  assert(term.text(0, 0, 4) == "h\xC3\xA9ll");
}

static void test_control_characters_take_one_column() {
  HeadlessTerminal term(2, 10);
  Window win(term, Rect{0, 0, 1, 10});
  int end = win.print(0, 0, Style{}, std::string("a\nb\x1b" "c\x7f" "d", 7));
  assert(end == 7);
  assert(term.line(0) == "a?b?c?d");
  assert(term.line(1).empty());
}

static void test_empty_window_draws_nothing() {
  HeadlessTerminal term(3, 3);
  Window win(term, Rect{0, 0, 0, 0});
  win.print(0, 0, Style{}, "abc");
  win.printl(0, 0, Style{}, "abc");
  assert(term.line(0).empty());
}

int main() {
  test_print_is_relative_and_clipped();
  test_tab_advances_to_next_stop();
  test_tab_is_relative_to_start_column();
  test_printl_pads_with_style();
  test_utf8_one_column_per_code_point();
  test_control_characters_take_one_column();
  test_empty_window_draws_nothing();
  return 0;
}
