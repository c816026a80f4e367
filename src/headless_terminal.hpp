#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: records cells, cursor and flushes,
 *          and replays a scripted event queue.
 * Note: an exhausted queue yields Esc, so input loops always terminate.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    char32_t ch = U' ';
    Style style{};
  };

  HeadlessTerminal(int rows, int cols);

  TermSize size() const override { return {rows_, cols_}; }
  void clear() override;
  void set_cell(int row, int col, char32_t ch, const Style& style) override;
  void set_cursor(int row, int col) override;
  void hide_cursor() override { cursor_visible_ = false; }
  void flush() override { flushes_++; }
  bool sync() override { syncs_++; return true; }
  Event poll_event() override;
  void suspend() override { suspended_ = true; }
  bool resume() override { suspended_ = false; return true; }

  void resize(int rows, int cols);
  void push_event(const Event& ev) { events_.push_back(ev); }
  void push_text(const std::string& text);

  const Cell& cell(int row, int col) const;
  // UTF-8 text of len cells starting at (row, col); len < 0 means to the end.
  std::string text(int row, int col = 0, int len = -1) const;
  // Row with trailing blanks removed.
  std::string line(int row) const;

  int flushes() const { return flushes_; }
  int syncs() const { return syncs_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  bool suspended() const { return suspended_; }
  size_t pending_events() const { return events_.size(); }

private:
  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  std::deque<Event> events_;
  int flushes_ = 0;
  int syncs_ = 0;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = false;
  bool suspended_ = false;
};
