#include "app.hpp"
#include "config.hpp"
#include "headless_terminal.hpp"
#include "test_util.hpp"
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

static void test_parse_ratios() {
  std::vector<int> r;
  assert(parse_ratios("1:2:3", r) && (r == std::vector<int>{1, 2, 3}));
  assert(parse_ratios("5", r) && (r == std::vector<int>{5}));
  r = {9};
  assert(!parse_ratios("", r));
  assert(!parse_ratios("1::2", r));
  assert(!parse_ratios("1:0", r));
  assert(!parse_ratios("1:-2", r));
  assert(!parse_ratios("1:2:", r));
  assert(!parse_ratios("a:b", r));
  assert(!parse_ratios("999999999:999999999:999999999", r));
  assert(parse_ratios("999999999:999999999", r) && r.size() == 2);
  r = {9};
  assert((r == std::vector<int>{9}));
}

static void test_set_option() {
  Options o = default_options();
  std::string msg;
  assert(set_option(o, "tabstop", "4", msg) && o.tabstop == 4);
  assert(!set_option(o, "tabstop", "0", msg) && o.tabstop == 4);
  assert(!set_option(o, "tabstop", "x", msg));
  assert(set_option(o, "ratios", "1:1", msg) && o.ratios.size() == 2);
  assert(set_option(o, "preview", "off", msg) && !o.preview);
  assert(set_option(o, "hidden", "true", msg) && o.hidden);
  assert(!set_option(o, "preview", "maybe", msg) && !o.preview);
  // validated when drawn, not here
  assert(set_option(o, "showinfo", "bogus", msg) && o.showinfo == "bogus");
  assert(!set_option(o, "colour", "on", msg));
  assert(msg == "unknown option: colour");
}

static void test_map_and_unmap() {
  Options o;
  std::string msg;
  assert(map_key(o, {"gh", "down", "3"}, msg));
  assert(o.keys["gh"].name == "down");
  assert((o.keys["gh"].args == std::vector<std::string>{"3"}));
  assert(o.keys["gh"].describe() == "down 3");
  assert(!map_key(o, {"gh"}, msg));
  assert(unmap_key(o, {"gh"}, msg));
  assert(o.keys.empty());
  assert(!unmap_key(o, {"gh"}, msg));
}

static void test_rc_path() {
  ::setenv("PANEFM_RC", "/some/where/rc", 1);
  assert(rc_path() && *rc_path() == "/some/where/rc");
  ::unsetenv("PANEFM_RC");
  ::setenv("HOME", "/home/someone", 1);
  assert(rc_path() && *rc_path() == "/home/someone/.panefmrc");
}

static void test_load_rc_runs_each_line() {
  TempDir tmp;
  write_file(tmp / "rc",
             "# comment\n"
             "\" vim style comment\n"
             "\n"
             "set tabstop 2\r\n"
             "  :set showinfo size\n"
             "map x quit\n"
             "unmap q\n"
             "set ratios nope\n"
             "set preview false\n");
  HeadlessTerminal term(10, 80);
  Options opts = default_options();
  App app(term, opts, tmp.path());
  assert(app.load_rc(tmp / "rc"));
  assert(opts.tabstop == 2);
  assert(opts.showinfo == "size");
  assert(opts.keys.count("x") && opts.keys["x"].name == "quit");
  assert(!opts.keys.count("q"));
  assert((opts.ratios == std::vector<int>{1, 2, 3}));
  assert(!opts.preview);
  // the bad line is reported, loading continues
  assert(app.ui().message().find("set ratios") == 0);

  assert(!app.load_rc(tmp / "missing"));
}

static void test_unknown_command_message() {
  TempDir tmp;
  HeadlessTerminal term(10, 80);
  Options opts = default_options();
  App app(term, opts, tmp.path());
  app.execute(parse_command("frobnicate now"));
  assert(app.ui().message() == "unknown command: frobnicate");
  app.execute(parse_command("quit"));
  assert(app.should_quit());
}

int main() {
  test_parse_ratios();
  test_set_option();
  test_map_and_unmap();
  test_rc_path();
  test_load_rc_runs_each_line();
  test_unknown_command_message();
  return 0;
}
