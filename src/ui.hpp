#pragma once
/*
 * UI
 *
 * Purpose: own the pane windows, path bar, status line and overlay menu;
 *          draw one frame per call and read commands/prompt input.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: single thread; every frame ends with exactly one flush.
 */
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "command.hpp"
#include "config.hpp"
#include "dir_renderer.hpp"
#include "iterminal.hpp"
#include "key_resolver.hpp"
#include "nav.hpp"
#include "window.hpp"

class UI {
public:
  using Completer = std::function<std::string(const std::string&)>;

  UI(ITerminal& term, const Options& opts, Completer comp_cmd, Completer comp_shell);

  // Recompute every window from the terminal size and the ratios.
  void renew();
  int pane_height() const;

  void draw(const Nav& nav);
  Command get_command();
  // Returns the entered line, or "" when cancelled with escape.
  std::string prompt(const std::string& pref);
  void list_binds(const std::vector<std::pair<std::string, Command>>& binds);

  void echo_file_info(const Nav& nav);
  void set_message(const std::string& msg) { message_ = msg; }
  const std::string& message() const { return message_; }
  void clear_msg();

  void pause();
  void resume();
  void sync();

  const std::vector<Window>& panes() const { return wins_; }

private:
  void draw_path_bar(const Nav& nav);
  void draw_preview(const Nav& nav, const Window& win);
  void draw_prompt_line(const std::string& pref, const std::u32string& acc);
  void report(const std::string& msg);

  ITerminal& term_;
  const Options& opts_;
  Completer comp_cmd_;
  Completer comp_shell_;
  KeyResolver resolver_;
  DirRenderer dir_renderer_;
  std::vector<Window> wins_;
  Window pwdwin_;
  Window msgwin_;
  Window menuwin_;
  std::string message_;
  std::string env_user_;
  std::string env_host_;
  std::string env_home_;
};

// "-rw-r--r--" style mode string
std::string mode_string(mode_t mode);
