#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <spdlog/spdlog.h>
#include "text_util.hpp"

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    default_colors_ = (use_default_colors() == OK);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::color_code(Color c) const {
  switch (c) {
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    case Color::Default: break;
  }
  return -1;
}

short NcursesTerminal::pair_for(Color fg, Color bg) {
  if (!has_colors() || (fg == Color::Default && bg == Color::Default)) return 0;
  short f = color_code(fg), b = color_code(bg);
  if (!default_colors_) {
    // fallback: white on black
    if (f < 0) f = COLOR_WHITE;
    if (b < 0) b = COLOR_BLACK;
  }
  auto key = std::make_pair(f, b);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  short id = next_pair_++;
  init_pair(id, f, b);
  pairs_.emplace(key, id);
  return id;
}

void NcursesTerminal::set_cell(int row, int col, char32_t ch, const Style& style) {
  TermSize sz = size();
  if (row < 0 || col < 0 || row >= sz.rows || col >= sz.cols) return;
  attr_t attrs = A_NORMAL;
  if (style.attrs & AttrBold) attrs |= A_BOLD;
  if (style.attrs & AttrReverse) attrs |= A_REVERSE;
  attr_set(attrs, pair_for(style.fg, style.bg), nullptr);
  std::string s = utf8_encode(ch);
  mvaddnstr(row, col, s.c_str(), (int)s.size());
  attr_set(A_NORMAL, 0, nullptr);
}

void NcursesTerminal::set_cursor(int row, int col) {
  move(row, col);
  curs_set(1);
}

void NcursesTerminal::hide_cursor() { curs_set(0); }

void NcursesTerminal::flush() { ::refresh(); }

bool NcursesTerminal::sync() {
  clearok(curscr, TRUE);
  return ::refresh() != ERR;
}

Event NcursesTerminal::poll_event() {
  wint_t wc = 0;
  int rc = get_wch(&wc);
  if (rc == ERR) return Event{};
  if (rc == KEY_CODE_YES) {
    switch (wc) {
      case KEY_RESIZE: return resize_event();
      case KEY_UP: return key_event(Key::Up);
      case KEY_DOWN: return key_event(Key::Down);
      case KEY_LEFT: return key_event(Key::Left);
      case KEY_RIGHT: return key_event(Key::Right);
      case KEY_ENTER: return key_event(Key::Enter);
      case KEY_BACKSPACE: return key_event(Key::Backspace2);
      default: return key_event(Key::Other);
    }
  }
  switch (wc) {
    case ' ': return key_event(Key::Space);
    case '\n': case '\r': return key_event(Key::Enter);
    case '\t': return key_event(Key::Tab);
    case 8: return key_event(Key::Backspace);
    case 127: return key_event(Key::Backspace2);
    case 12: return key_event(Key::CtrlL);
    case 27: return key_event(Key::Esc);
    default: break;
  }
  if (wc < 32) return key_event(Key::Other);
  return char_event(static_cast<char32_t>(wc));
}

void NcursesTerminal::suspend() {
  def_prog_mode();
  endwin();
}

bool NcursesTerminal::resume() {
  reset_prog_mode();
  if (::refresh() == ERR) {
    spdlog::error("resuming terminal failed");
    return false;
  }
  return true;
}
