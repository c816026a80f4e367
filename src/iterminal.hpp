#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, cells, cursor, flush, events).
 * Goal: decouple from concrete impls (ncurses/headless/etc), enable testing.
 */
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize size() const = 0;
  virtual void clear() = 0;
  virtual void set_cell(int row, int col, char32_t ch, const Style& style) = 0;
  virtual void set_cursor(int row, int col) = 0;
  virtual void hide_cursor() = 0;
  virtual void flush() = 0;
  // Discard what the backend believes is on screen and repaint everything.
  virtual bool sync() = 0;
  // Blocks until a key or resize event arrives.
  virtual Event poll_event() = 0;
  // Hand the tty to a child process and take it back afterwards.
  virtual void suspend() = 0;
  virtual bool resume() = 0;
};
