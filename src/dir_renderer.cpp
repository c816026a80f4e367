#include "dir_renderer.hpp"
#include <algorithm>
#include <ctime>
#include <sys/stat.h>
#include <spdlog/spdlog.h>
#include "text_util.hpp"

DirViewport dir_viewport(int ind, int pos, int height, int count) {
  DirViewport vp;
  vp.beg = std::max(ind - pos, 0);
  vp.end = std::min(vp.beg + std::max(height, 0), count);
  if (vp.end < vp.beg) vp.end = vp.beg;
  return vp;
}

FileKind classify(mode_t mode) {
  if (S_ISREG(mode)) return (mode & 0111) ? FileKind::RegularExecutable : FileKind::RegularOther;
  if (S_ISDIR(mode)) return FileKind::Directory;
  if (S_ISLNK(mode)) return FileKind::Symlink;
  if (S_ISFIFO(mode)) return FileKind::Fifo;
  if (S_ISSOCK(mode)) return FileKind::Socket;
  if (S_ISCHR(mode) || S_ISBLK(mode)) return FileKind::Device;
  return FileKind::Other;
}

Style kind_style(FileKind kind) {
  switch (kind) {
    case FileKind::RegularExecutable: return bold(Color::Green);
    case FileKind::Directory: return bold(Color::Blue);
    case FileKind::Symlink: return Style{Color::Cyan};
    case FileKind::Fifo: return Style{Color::Red};
    case FileKind::Socket: return Style{Color::Yellow};
    case FileKind::Device: return Style{Color::White};
    case FileKind::RegularOther:
    case FileKind::Other:
      break;
  }
  return Style{};
}

std::optional<ShowInfo> parse_show_info(const std::string& s) {
  if (s == "none") return ShowInfo::None;
  if (s == "size") return ShowInfo::Size;
  if (s == "time") return ShowInfo::Time;
  return std::nullopt;
}

static std::string format_mtime(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%b %e %H:%M", &tm);
  return std::string(buf, n);
}

// Replace the tail of a width-2 row with " info", keeping the row length.
static void put_trailing(std::u32string& row, int width, const std::string& info) {
  std::u32string tail = utf8_decode(info);
  size_t keep = static_cast<size_t>(std::max(0, width - 3 - static_cast<int>(tail.size())));
  row.resize(std::min(keep, row.size()), U' ');
  row.push_back(U' ');
  row += tail;
}

bool DirRenderer::draw(const Window& win, const Dir& dir, const MarkSet& marks,
                       const std::string& showinfo, std::string& msg) {
  if (win.width() < 3) return true;

  if (dir.entries.empty()) {
    win.print(0, 0, bold(), "empty");
    return true;
  }

  bool ok = true;
  std::optional<ShowInfo> info = parse_show_info(showinfo);
  if (!info) {
    ok = false;
    msg = "unknown showinfo type: " + showinfo;
    if (warned_.insert(showinfo).second) spdlog::warn("{}", msg);
  }

  const int w = win.width();
  const int field = w - 2;
  DirViewport vp = dir_viewport(dir.ind, dir.pos, win.height(), static_cast<int>(dir.entries.size()));

  for (int i = 0; vp.beg + i < vp.end; ++i) {
    const FileEntry& f = dir.entries[vp.beg + i];
    Style st = kind_style(classify(f.mode));

    if (marks.count(f.path.string())) win.print(0, i, Style{st.fg, Color::Magenta, st.attrs}, " ");

    if (vp.beg + i == dir.ind) st = st.reversed();

    std::u32string row = U" " + utf8_decode(f.name);
    row.resize(static_cast<size_t>(field), U' ');

    if (info == ShowInfo::Size && w > 8) {
      put_trailing(row, w, humanize(f.size));
    } else if (info == ShowInfo::Time && w > 24) {
      put_trailing(row, w, format_mtime(f.mtime));
    }

    win.print(1, i, st, utf8_encode(row));
  }
  return ok;
}
