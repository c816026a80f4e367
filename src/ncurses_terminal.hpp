#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation on ncursesw (cells, cursor, key events).
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include <map>
#include <utility>
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  TermSize size() const override;
  void clear() override;
  void set_cell(int row, int col, char32_t ch, const Style& style) override;
  void set_cursor(int row, int col) override;
  void hide_cursor() override;
  void flush() override;
  bool sync() override;
  Event poll_event() override;
  void suspend() override;
  bool resume() override;

private:
  short pair_for(Color fg, Color bg);
  short color_code(Color c) const;

  bool default_colors_ = false;
  short next_pair_ = 1;
  std::map<std::pair<short, short>, short> pairs_;
};
