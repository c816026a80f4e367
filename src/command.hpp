#pragma once
/*
 * Command
 *
 * Purpose: opaque command value produced by key bindings and the prompt.
 * Note: only the name/args pair is meaningful; execution lives in App.
 */
#include <map>
#include <string>
#include <vector>

struct Command {
  std::string name;
  std::vector<std::string> args;

  std::string describe() const {
    std::string s = name;
    for (const auto& a : args) { s += ' '; s += a; }
    return s;
  }
  bool operator==(const Command& o) const { return name == o.name && args == o.args; }
  bool operator!=(const Command& o) const { return !(*this == o); }
};

inline Command redraw_command() { return Command{"redraw", {}}; }

// Splits on blanks: "set ratios 1:2" -> {"set", {"ratios", "1:2"}}
Command parse_command(const std::string& line);

using KeyMap = std::map<std::string, Command>;
