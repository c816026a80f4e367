#pragma once
/*
 * Options
 *
 * Purpose: the option set shared by UI and KeyResolver, built once in main
 *          and passed by reference; nothing reads options from globals.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "command.hpp"

struct Options {
  std::vector<int> ratios{1, 2, 3};
  int tabstop = 8;
  std::string showinfo = "none"; // none|size|time, checked when drawing
  bool preview = true;
  bool hidden = false;
  KeyMap keys;
};

Options default_options();

bool parse_ratios(const std::string& s, std::vector<int>& out);
bool parse_bool(const std::string& s, bool& out);

// set <name> <value>; leaves opts untouched and fills msg on bad input.
bool set_option(Options& opts, const std::string& name, const std::string& value, std::string& msg);
bool map_key(Options& opts, const std::vector<std::string>& args, std::string& msg);
bool unmap_key(Options& opts, const std::vector<std::string>& args, std::string& msg);

// $PANEFM_RC, else $HOME/.panefmrc
std::optional<std::filesystem::path> rc_path();
