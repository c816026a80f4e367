#include "nav.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <spdlog/spdlog.h>

bool stat_entry(const std::filesystem::path& path, FileEntry& out, std::string& msg) {
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    msg = "getting file information: " + path.string() + ": " + std::strerror(errno);
    return false;
  }
  out.name = path.filename().string();
  out.path = path;
  out.mode = st.st_mode;
  out.size = static_cast<std::int64_t>(st.st_size);
  out.mtime = st.st_mtime;
  return true;
}

bool load_dir(const std::filesystem::path& path, bool show_hidden, Dir& out, std::string& msg) {
  out = Dir{};
  out.path = path;
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    msg = "reading directory: " + path.string() + ": " + ec.message();
    return false;
  }
  bool ok = true;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      msg = "reading directory: " + path.string() + ": " + ec.message();
      ok = false;
      break;
    }
    std::string name = it->path().filename().string();
    if (!show_hidden && !name.empty() && name[0] == '.') continue;
    FileEntry fe;
    std::string m;
    if (!stat_entry(it->path(), fe, m)) {
      // entry vanished between readdir and lstat
      spdlog::debug("{}", m);
      continue;
    }
    out.entries.push_back(std::move(fe));
  }
  std::sort(out.entries.begin(), out.entries.end(), [](const FileEntry& a, const FileEntry& b) {
    bool da = S_ISDIR(a.mode), db = S_ISDIR(b.mode);
    if (da != db) return da;
    return a.name < b.name;
  });
  return ok;
}

Nav::Nav(const std::filesystem::path& start, int height, bool show_hidden)
    : height_(std::max(1, height)), show_hidden_(show_hidden) {
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(start, ec).lexically_normal();
  if (ec) abs = start;
  if (abs.has_filename() == false && abs != abs.root_path()) abs = abs.parent_path();

  std::vector<std::filesystem::path> chain;
  for (std::filesystem::path p = abs;; p = p.parent_path()) {
    chain.push_back(p);
    if (p == p.parent_path()) break;
  }
  std::reverse(chain.begin(), chain.end());

  for (size_t i = 0; i < chain.size(); ++i) {
    Dir d;
    std::string m;
    if (!load_dir(chain[i], show_hidden_, d, m)) {
      message_ = m;
      spdlog::error("{}", m);
    }
    if (i + 1 < chain.size()) {
      std::string child = chain[i + 1].filename().string();
      for (size_t k = 0; k < d.entries.size(); ++k) {
        if (d.entries[k].name == child) { d.ind = static_cast<int>(k); break; }
      }
      d.pos = std::min(d.ind, height_ - 1);
    }
    dirs_.push_back(std::move(d));
  }
}

const FileEntry* Nav::curr_file() const {
  const Dir& d = curr_dir();
  if (d.entries.empty()) return nullptr;
  return &d.entries[d.ind];
}

std::filesystem::path Nav::curr_path() const {
  const FileEntry* f = curr_file();
  return f ? f->path : curr_dir().path;
}

void Nav::clamp_pos(Dir& d) const {
  if (d.entries.empty()) { d.ind = 0; d.pos = 0; return; }
  d.ind = std::clamp(d.ind, 0, static_cast<int>(d.entries.size()) - 1);
  d.pos = std::clamp(d.pos, 0, std::min(d.ind, height_ - 1));
}

void Nav::set_height(int height) {
  height_ = std::max(1, height);
  for (auto& d : dirs_) clamp_pos(d);
}

void Nav::set_show_hidden(bool show_hidden) {
  if (show_hidden_ == show_hidden) return;
  show_hidden_ = show_hidden;
  reload();
}

void Nav::up(int n) {
  Dir& d = curr_dir();
  if (d.entries.empty()) return;
  int old = d.ind;
  d.ind = std::max(d.ind - n, 0);
  d.pos = std::max(d.pos - (old - d.ind), 0);
}

void Nav::down(int n) {
  Dir& d = curr_dir();
  if (d.entries.empty()) return;
  int old = d.ind;
  d.ind = std::min(d.ind + n, static_cast<int>(d.entries.size()) - 1);
  d.pos = std::min(d.pos + (d.ind - old), height_ - 1);
}

void Nav::top() {
  Dir& d = curr_dir();
  d.ind = 0;
  d.pos = 0;
}

void Nav::bottom() {
  Dir& d = curr_dir();
  if (d.entries.empty()) return;
  d.ind = static_cast<int>(d.entries.size()) - 1;
  d.pos = std::min(d.ind, height_ - 1);
}

void Nav::save_state(const Dir& d) {
  std::string key = d.path.string();
  inds_[key] = d.ind;
  poss_[key] = d.pos;
  if (!d.entries.empty()) names_[key] = d.entries[d.ind].name;
}

void Nav::restore(Dir& d) const {
  std::string key = d.path.string();
  auto ii = inds_.find(key);
  auto pi = poss_.find(key);
  d.ind = ii != inds_.end() ? ii->second : 0;
  d.pos = pi != poss_.end() ? pi->second : 0;
  auto ni = names_.find(key);
  if (ni != names_.end() && !d.entries.empty()) {
    int cached = std::clamp(d.ind, 0, static_cast<int>(d.entries.size()) - 1);
    if (d.entries[cached].name != ni->second) {
      for (size_t k = 0; k < d.entries.size(); ++k) {
        if (d.entries[k].name == ni->second) {
          d.pos += static_cast<int>(k) - d.ind;
          d.ind = static_cast<int>(k);
          break;
        }
      }
    }
  }
  clamp_pos(d);
}

bool Nav::load_cached(const std::filesystem::path& path, Dir& out, std::string& msg) const {
  bool ok = load_dir(path, show_hidden_, out, msg);
  restore(out);
  return ok;
}

Dir Nav::reload_one(const std::filesystem::path& path) {
  Dir d;
  std::string m;
  if (!load_cached(path, d, m)) {
    message_ = m;
    spdlog::error("{}", m);
  }
  return d;
}

bool Nav::updir() {
  if (dirs_.size() <= 1) return false;
  save_state(dirs_.back());
  dirs_.pop_back();
  save_state(dirs_.back());
  dirs_.back() = reload_one(dirs_.back().path);
  return true;
}

bool Nav::open() {
  const FileEntry* f = curr_file();
  if (!f) return false;
  std::error_code ec;
  if (!std::filesystem::is_directory(f->path, ec)) return false;
  std::filesystem::path target = f->path;
  save_state(curr_dir());
  dirs_.push_back(reload_one(target));
  return true;
}

void Nav::toggle_mark() {
  const FileEntry* f = curr_file();
  if (!f) return;
  std::string key = f->path.string();
  if (!marks_.erase(key)) marks_.insert(key);
  down(1);
}

void Nav::reload() {
  for (auto& d : dirs_) {
    save_state(d);
    d = reload_one(d.path);
  }
}
