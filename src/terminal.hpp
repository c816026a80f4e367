#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal.
 * Note: throws std::runtime_error when no terminal can be initialised;
 *       there is no fallback surface.
 */
struct screen;

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  struct screen* screen_ = nullptr;
};
