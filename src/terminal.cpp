#include "terminal.hpp"
#include <ncurses.h>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

Terminal::Terminal() {
  std::setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* term = std::getenv("TERM");
    throw std::runtime_error(std::string("initializing terminal: cannot open terminal '") +
                             (term ? term : "") + "'");
  }
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  curs_set(0);
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
