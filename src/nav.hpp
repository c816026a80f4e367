#pragma once
/*
 * Nav
 *
 * Purpose: directory snapshots, the directory stack, marks and the per-path
 *          scroll cache consumed by the UI each frame.
 * Invariant: for every Dir, 0 <= pos <= min(ind, height - 1).
 */
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct FileEntry {
  std::string name;
  std::filesystem::path path;
  mode_t mode = 0;
  std::int64_t size = 0;
  std::time_t mtime = 0;
};

struct Dir {
  std::filesystem::path path;
  std::vector<FileEntry> entries;
  int ind = 0; // selection index
  int pos = 0; // selection row within the viewport
};

using MarkSet = std::unordered_set<std::string>;

// Directories first, then by name. Returns false with msg if the directory
// cannot be read; out then holds an empty snapshot for the path.
bool load_dir(const std::filesystem::path& path, bool show_hidden, Dir& out, std::string& msg);

bool stat_entry(const std::filesystem::path& path, FileEntry& out, std::string& msg);

class Nav {
public:
  Nav(const std::filesystem::path& start, int height, bool show_hidden);

  const std::vector<Dir>& dirs() const { return dirs_; }
  const MarkSet& marks() const { return marks_; }
  int height() const { return height_; }
  const std::string& message() const { return message_; }
  void clear_message() { message_.clear(); }

  Dir& curr_dir() { return dirs_.back(); }
  const Dir& curr_dir() const { return dirs_.back(); }
  const FileEntry* curr_file() const;
  std::filesystem::path curr_path() const;

  void set_height(int height);
  void set_show_hidden(bool show_hidden);

  void up(int n = 1);
  void down(int n = 1);
  void top();
  void bottom();
  bool updir();
  bool open();
  void toggle_mark();
  void reload();

  // Fresh snapshot of path with ind/pos restored from the cache.
  bool load_cached(const std::filesystem::path& path, Dir& out, std::string& msg) const;

private:
  Dir reload_one(const std::filesystem::path& path);
  void save_state(const Dir& d);
  void restore(Dir& d) const;
  void clamp_pos(Dir& d) const;

  std::vector<Dir> dirs_;
  MarkSet marks_;
  std::unordered_map<std::string, int> inds_;
  std::unordered_map<std::string, int> poss_;
  std::unordered_map<std::string, std::string> names_;
  int height_ = 1;
  bool show_hidden_ = false;
  std::string message_;
};
