#include "app.hpp"
#include <algorithm>
#include <cstdlib>
#include <sys/stat.h>
#include <sys/wait.h>
#include <spdlog/spdlog.h>
#include "file_reader.hpp"
#include "text_util.hpp"

static int count_arg(const std::vector<std::string>& args) {
  if (args.empty()) return 1;
  const std::string& s = args[0];
  if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos) return 1;
  return std::max(1, std::stoi(s));
}

static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

App::App(ITerminal& term, Options& opts, const std::filesystem::path& start)
    : opts_(opts),
      ui_(term, opts,
          [this](const std::string& acc) { return comp_cmd(acc); },
          [this](const std::string& acc) { return comp_shell(acc); }),
      nav_(start, ui_.pane_height(), opts.hidden) {
  register_commands();
  sync_nav_message();
}

void App::warn(const std::string& msg) {
  spdlog::warn("{}", msg);
  ui_.set_message(msg);
}

void App::sync_nav_message() {
  if (nav_.message().empty()) return;
  ui_.set_message(nav_.message());
  nav_.clear_message();
}

void App::register_commands() {
  registry_.register_command("up", [this](const std::vector<std::string>& args) { nav_.up(count_arg(args)); });
  registry_.register_command("down", [this](const std::vector<std::string>& args) { nav_.down(count_arg(args)); });
  registry_.register_command("top", [this](const std::vector<std::string>&) { nav_.top(); });
  registry_.register_command("bottom", [this](const std::vector<std::string>&) { nav_.bottom(); });
  registry_.register_command("updir", [this](const std::vector<std::string>&) { nav_.updir(); });
  registry_.register_command("open", [this](const std::vector<std::string>&) {
    if (nav_.open()) return;
    if (const FileEntry* f = nav_.curr_file()) open_file(f->path);
  });
  registry_.register_command("toggle", [this](const std::vector<std::string>&) { nav_.toggle_mark(); });
  registry_.register_command("redraw", [this](const std::vector<std::string>&) {
    ui_.sync();
    ui_.renew();
    nav_.set_height(ui_.pane_height());
  });
  registry_.register_command("echo-info", [this](const std::vector<std::string>&) { ui_.echo_file_info(nav_); });
  registry_.register_command("read", [this](const std::vector<std::string>&) {
    std::string line = ui_.prompt(":");
    if (line.empty()) return;
    execute(parse_command(line));
  });
  registry_.register_command("shell", [this](const std::vector<std::string>&) {
    std::string line = ui_.prompt("$");
    if (line.empty()) return;
    run_shell(line);
  });
  registry_.register_command("set", [this](const std::vector<std::string>& args) {
    if (args.size() != 2) { warn("set: use :set <option> <value>"); return; }
    std::string msg;
    if (!set_option(opts_, args[0], args[1], msg)) { warn(msg); return; }
    if (args[0] == "hidden") nav_.set_show_hidden(opts_.hidden);
  });
  registry_.register_command("map", [this](const std::vector<std::string>& args) {
    std::string msg;
    if (!map_key(opts_, args, msg)) warn(msg);
  });
  registry_.register_command("unmap", [this](const std::vector<std::string>& args) {
    std::string msg;
    if (!unmap_key(opts_, args, msg)) warn(msg);
  });
  registry_.register_command("quit", [this](const std::vector<std::string>&) { should_quit_ = true; });
}

void App::execute(const Command& cmd) {
  if (cmd.name.empty()) return;
  spdlog::debug("execute {}", cmd.describe());
  if (!registry_.execute(cmd.name, cmd.args)) ui_.set_message("unknown command: " + cmd.name);
  sync_nav_message();
}

void App::run() {
  while (!should_quit_) {
    ui_.renew();
    nav_.set_height(ui_.pane_height());
    ui_.draw(nav_);
    execute(ui_.get_command());
  }
}

bool App::load_rc(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::string msg;
  if (!mmap_readlines(path, lines, msg)) { warn(msg); return false; }
  for (std::string s : lines) {
    size_t i = s.find_first_not_of(" \t");
    if (i == std::string::npos) continue;
    s = s.substr(i);
    if (s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute(parse_command(s));
  }
  spdlog::info("loaded {}", path.string());
  return true;
}

std::string App::comp_cmd(const std::string& acc) const {
  if (acc.find(' ') != std::string::npos) return acc;
  std::vector<std::string> names = registry_.names_with_prefix(acc);
  if (names.empty()) return acc;
  if (names.size() == 1) return names[0] + " ";
  return longest_common_prefix(names);
}

std::string App::comp_shell(const std::string& acc) const {
  size_t sp = acc.find_last_of(' ');
  std::string head = sp == std::string::npos ? std::string() : acc.substr(0, sp + 1);
  std::string word = sp == std::string::npos ? acc : acc.substr(sp + 1);

  std::vector<std::string> names;
  bool unique_dir = false;
  for (const auto& f : nav_.curr_dir().entries) {
    if (f.name.compare(0, word.size(), word) != 0) continue;
    names.push_back(f.name);
    unique_dir = S_ISDIR(f.mode);
  }
  if (names.empty()) return acc;
  if (names.size() == 1) return head + names[0] + (unique_dir ? "/" : " ");
  return head + longest_common_prefix(names);
}

void App::open_file(const std::filesystem::path& path) {
  const char* opener = std::getenv("OPENER");
  run_shell(std::string(opener && *opener ? opener : "xdg-open") + " " + shell_quote(path.string()));
}

void App::run_shell(const std::string& cmd) {
  ::setenv("f", nav_.curr_path().c_str(), 1);
  std::string fs;
  for (const auto& m : nav_.marks()) {
    if (!fs.empty()) fs.push_back('\n');
    fs += m;
  }
  ::setenv("fs", fs.c_str(), 1);

  spdlog::info("shell: {}", cmd);
  ui_.pause();
  int rc = std::system(cmd.c_str());
  ui_.resume();
  ui_.sync();

  if (rc == -1) warn("shell: cannot run command");
  else if (WIFEXITED(rc) && WEXITSTATUS(rc) != 0) ui_.set_message("shell: exit status " + std::to_string(WEXITSTATUS(rc)));
  nav_.reload();
}
