#include "ui.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "previewer.hpp"
#include "text_util.hpp"

static std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static int text_width(const std::string& s) { return static_cast<int>(utf8_decode(s).size()); }

std::string mode_string(mode_t mode) {
  std::string s(10, '-');
  if (S_ISDIR(mode)) s[0] = 'd';
  else if (S_ISLNK(mode)) s[0] = 'l';
  else if (S_ISFIFO(mode)) s[0] = 'p';
  else if (S_ISSOCK(mode)) s[0] = 's';
  else if (S_ISCHR(mode)) s[0] = 'c';
  else if (S_ISBLK(mode)) s[0] = 'b';
  const char rwx[] = "rwxrwxrwx";
  for (int i = 0; i < 9; ++i) {
    if (mode & (1 << (8 - i))) s[i + 1] = rwx[i];
  }
  return s;
}

UI::UI(ITerminal& term, const Options& opts, Completer comp_cmd, Completer comp_shell)
    : term_(term),
      opts_(opts),
      comp_cmd_(std::move(comp_cmd)),
      comp_shell_(std::move(comp_shell)),
      resolver_(opts) {
  env_user_ = env_or_empty("USER");
  env_home_ = env_or_empty("HOME");
  char host[256] = {0};
  if (::gethostname(host, sizeof(host) - 1) == 0) env_host_ = host;
  renew();
}

void UI::renew() {
  TermSize sz = term_.size();
  std::vector<Rect> rects = pane_rects(sz.cols, sz.rows, opts_.ratios);
  if (wins_.size() != rects.size()) {
    wins_.assign(rects.size(), Window(term_, Rect{}, opts_.tabstop));
  }
  for (size_t i = 0; i < rects.size(); ++i) {
    wins_[i].renew(rects[i]);
    wins_[i].set_tabstop(opts_.tabstop);
  }
  pwdwin_ = Window(term_, Rect{0, 0, 1, sz.cols}, opts_.tabstop);
  msgwin_ = Window(term_, Rect{sz.rows - 1, 0, 1, sz.cols}, opts_.tabstop);
  menuwin_ = Window(term_, Rect{sz.rows - 2, 0, 1, sz.cols}, opts_.tabstop);
}

int UI::pane_height() const {
  return wins_.empty() ? 0 : wins_.front().height();
}

void UI::report(const std::string& msg) {
  message_ = msg;
  spdlog::error("{}", msg);
}

void UI::draw_path_bar(const Nav& nav) {
  std::string path = nav.curr_dir().path.string();
  if (!env_home_.empty() && path.compare(0, env_home_.size(), env_home_) == 0 &&
      (path.size() == env_home_.size() || path[env_home_.size()] == '/')) {
    path = "~" + path.substr(env_home_.size());
  }
  int x = pwdwin_.print(0, 0, bold(Color::Green), env_user_ + "@" + env_host_);
  x = pwdwin_.print(x, 0, Style{}, ":");
  pwdwin_.print(x, 0, bold(Color::Blue), path);
}

void UI::draw(const Nav& nav) {
  renew();
  term_.clear();

  draw_path_bar(nav);

  const int nwins = static_cast<int>(wins_.size());
  const int ndirs = static_cast<int>(nav.dirs().size());
  const int avail = opts_.preview ? std::max(nwins - 1, 0) : nwins;
  const int length = std::min(avail, ndirs);
  const int woff = avail - length;
  const int doff = ndirs - length;
  for (int i = 0; i < length; ++i) {
    std::string msg;
    if (!dir_renderer_.draw(wins_[woff + i], nav.dirs()[doff + i], nav.marks(), opts_.showinfo, msg)) {
      message_ = msg;
    }
  }

  if (opts_.preview && nwins > 0 && !nav.curr_dir().entries.empty()) {
    draw_preview(nav, wins_.back());
  }

  msgwin_.print(0, 0, Style{}, message_);
  term_.flush();
}

void UI::draw_preview(const Nav& nav, const Window& win) {
  std::filesystem::path path = nav.curr_path();

  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    report("getting file information: " + path.string() + ": " + std::strerror(errno));
    return;
  }

  if (S_ISDIR(st.st_mode)) {
    Dir dir;
    std::string msg;
    if (!nav.load_cached(path, dir, msg)) report(msg);
    if (!dir_renderer_.draw(win, dir, nav.marks(), opts_.showinfo, msg)) message_ = msg;
  } else if (S_ISREG(st.st_mode)) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      report("opening file: " + path.string() + ": " + std::strerror(errno));
      return;
    }
    std::string msg;
    if (!preview_file(win, file, msg)) report(msg);
  }
}

Command UI::get_command() {
  for (;;) {
    Event ev = term_.poll_event();
    KeyResolver::Result r = resolver_.feed(ev);
    switch (r.outcome) {
      case KeyResolver::Outcome::Dispatch:
        return r.command;
      case KeyResolver::Outcome::Reset:
        if (!r.message.empty()) message_ = r.message;
        return r.command;
      case KeyResolver::Outcome::Pending:
        list_binds(r.candidates);
        break;
      case KeyResolver::Outcome::Ignored:
        break;
    }
  }
}

void UI::list_binds(const std::vector<std::pair<std::string, Command>>& binds) {
  const std::string head_key = "keys";
  const std::string head_cmd = "command";

  int keyw = text_width(head_key);
  for (const auto& b : binds) keyw = std::max(keyw, text_width(b.first));
  keyw += 2;

  TermSize sz = term_.size();
  int shown = std::min(static_cast<int>(binds.size()), std::max(0, sz.rows - 3));
  int bottom = sz.rows - 2;
  menuwin_ = Window(term_, Rect{bottom - shown, 0, shown + 1, sz.cols}, opts_.tabstop);

  auto row_text = [keyw](const std::string& key, const std::string& cmd) {
    std::string s = key;
    s.append(static_cast<size_t>(keyw - text_width(key)), ' ');
    return s + cmd;
  };

  menuwin_.printl(0, 0, bold(), row_text(head_key, head_cmd));
  for (int i = 0; i < shown; ++i) {
    const auto& b = binds[binds.size() - shown + i];
    menuwin_.printl(0, i + 1, Style{}, row_text(b.first, b.second.describe()));
  }
  term_.flush();
}

void UI::echo_file_info(const Nav& nav) {
  const FileEntry* f = nav.curr_file();
  if (!f) return;
  std::tm tm{};
  localtime_r(&f->mtime, &tm);
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Y", &tm);
  message_ = mode_string(f->mode) + " " + humanize(f->size) + " " + std::string(buf, n);
}

void UI::clear_msg() {
  msgwin_.printl(0, 0, Style{}, "");
  term_.set_cursor(msgwin_.y(), msgwin_.x());
  term_.flush();
}

void UI::draw_prompt_line(const std::string& pref, const std::u32string& acc) {
  msgwin_.printl(0, 0, Style{}, pref);
  msgwin_.print(text_width(pref), 0, Style{}, utf8_encode(acc));
  term_.set_cursor(msgwin_.y(), msgwin_.x() + text_width(pref) + static_cast<int>(acc.size()));
  term_.flush();
}

std::string UI::prompt(const std::string& pref) {
  std::u32string acc;
  draw_prompt_line(pref, acc);

  for (;;) {
    Event ev = term_.poll_event();
    if (ev.type == Event::Type::None) continue;
    if (ev.type == Event::Type::Resize) {
      renew();
      draw_prompt_line(pref, acc);
      continue;
    }
    switch (ev.key) {
      case Key::Char:
        acc.push_back(ev.ch);
        break;
      case Key::Space:
        acc.push_back(U' ');
        break;
      case Key::Backspace:
      case Key::Backspace2:
        if (!acc.empty()) acc.pop_back();
        break;
      case Key::Enter: {
        msgwin_.printl(0, 0, Style{}, "");
        term_.set_cursor(msgwin_.y(), msgwin_.x());
        term_.hide_cursor();
        term_.flush();
        return utf8_encode(acc);
      }
      case Key::Tab: {
        const Completer& comp = pref == ":" ? comp_cmd_ : comp_shell_;
        if (comp) acc = utf8_decode(comp(utf8_encode(acc)));
        break;
      }
      case Key::Esc:
        term_.hide_cursor();
        return std::string();
      default:
        break;
    }
    draw_prompt_line(pref, acc);
  }
}

void UI::pause() { term_.suspend(); }

void UI::resume() {
  if (!term_.resume()) throw std::runtime_error("initializing terminal: resume failed");
}

void UI::sync() {
  if (!term_.sync()) spdlog::error("syncing terminal failed");
  term_.set_cursor(0, 0);
  term_.hide_cursor();
}
