#pragma once
/*
 * App
 *
 * Purpose: main loop (draw, read command, execute) and the built-in commands.
 * Note: the only place that mutates Nav or Options after startup.
 */
#include <filesystem>
#include <string>
#include "cmd_registry.hpp"
#include "command.hpp"
#include "config.hpp"
#include "iterminal.hpp"
#include "nav.hpp"
#include "ui.hpp"

class App {
public:
  App(ITerminal& term, Options& opts, const std::filesystem::path& start);

  void run();
  void execute(const Command& cmd);
  bool load_rc(const std::filesystem::path& path);

  std::string comp_cmd(const std::string& acc) const;
  std::string comp_shell(const std::string& acc) const;

  bool should_quit() const { return should_quit_; }
  UI& ui() { return ui_; }
  Nav& nav() { return nav_; }

private:
  void register_commands();
  void warn(const std::string& msg);
  void run_shell(const std::string& cmd);
  void open_file(const std::filesystem::path& path);
  void sync_nav_message();

  Options& opts_;
  CommandRegistry registry_;
  UI ui_;
  Nav nav_;
  bool should_quit_ = false;
};
