#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <sstream>

Options default_options() {
  Options o;
  auto bind = [&o](const std::string& key, const std::string& cmd) { o.keys[key] = parse_command(cmd); };
  bind("k", "up");
  bind("<up>", "up");
  bind("j", "down");
  bind("<down>", "down");
  bind("h", "updir");
  bind("<left>", "updir");
  bind("l", "open");
  bind("<right>", "open");
  bind("<cr>", "open");
  bind("gg", "top");
  bind("G", "bottom");
  bind("<space>", "toggle");
  bind("<c-l>", "redraw");
  bind("i", "echo-info");
  bind(":", "read");
  bind("$", "shell");
  bind("q", "quit");
  return o;
}

static bool parse_positive(const std::string& s, int& out) {
  if (s.empty() || s.size() > 9) return false;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  int v = std::stoi(s);
  if (v < 1) return false;
  out = v;
  return true;
}

bool parse_ratios(const std::string& s, std::vector<int>& out) {
  std::vector<int> rs;
  std::istringstream iss(s);
  std::string part;
  std::int64_t sum = 0;
  while (std::getline(iss, part, ':')) {
    int v = 0;
    if (!parse_positive(part, v)) return false;
    sum += v;
    if (sum > INT_MAX) return false;
    rs.push_back(v);
  }
  if (rs.empty() || s.back() == ':') return false;
  out = std::move(rs);
  return true;
}

bool parse_bool(const std::string& s, bool& out) {
  if (s == "true" || s == "on") { out = true; return true; }
  if (s == "false" || s == "off") { out = false; return true; }
  return false;
}

bool set_option(Options& opts, const std::string& name, const std::string& value, std::string& msg) {
  if (name == "ratios") {
    if (!parse_ratios(value, opts.ratios)) { msg = "set ratios: use :set ratios <n>:<n>..."; return false; }
  } else if (name == "tabstop") {
    if (!parse_positive(value, opts.tabstop)) { msg = "set tabstop: must be a positive number"; return false; }
  } else if (name == "showinfo") {
    if (value.empty()) { msg = "set showinfo: use :set showinfo none|size|time"; return false; }
    opts.showinfo = value;
  } else if (name == "preview") {
    if (!parse_bool(value, opts.preview)) { msg = "set preview: use :set preview true|false"; return false; }
  } else if (name == "hidden") {
    if (!parse_bool(value, opts.hidden)) { msg = "set hidden: use :set hidden true|false"; return false; }
  } else {
    msg = "unknown option: " + name;
    return false;
  }
  return true;
}

bool map_key(Options& opts, const std::vector<std::string>& args, std::string& msg) {
  if (args.size() < 2) { msg = "map: use :map <keys> <command>"; return false; }
  Command c;
  c.name = args[1];
  c.args.assign(args.begin() + 2, args.end());
  opts.keys[args[0]] = std::move(c);
  return true;
}

bool unmap_key(Options& opts, const std::vector<std::string>& args, std::string& msg) {
  if (args.size() != 1) { msg = "unmap: use :unmap <keys>"; return false; }
  if (!opts.keys.erase(args[0])) { msg = "unmap: no mapping for " + args[0]; return false; }
  return true;
}

std::optional<std::filesystem::path> rc_path() {
  if (const char* rc = std::getenv("PANEFM_RC")) return std::filesystem::path(rc);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".panefmrc";
}
