#include "previewer.hpp"
#include "text_util.hpp"

namespace {

constexpr size_t kMaxLine = 64 * 1024;

const char* const kTooLong = "printing regular file: line too long";

bool is_text_rune(char32_t r) { return is_space_rune(r) || is_print_rune(r); }

// Holds the bytes of one multi-byte sequence until the next lead byte,
// so a line is classified as it is read.
class RuneScanner {
public:
  bool feed(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if ((u & 0xC0) == 0x80 && !pending_.empty() && pending_.size() < 4) {
      pending_.push_back(c);
      return true;
    }
    if (!flush()) return false;
    if (u < 0x80) return is_text_rune(u);
    pending_.push_back(c);
    return true;
  }

  bool flush() {
    if (pending_.empty()) return true;
    std::u32string runes = utf8_decode(pending_);
    pending_.clear();
    for (char32_t r : runes) {
      if (!is_text_rune(r)) return false;
    }
    return true;
  }

private:
  std::string pending_;
};

enum class LineRead { Ok, End, TooLong };

LineRead read_line(std::istream& in, std::string& line) {
  line.clear();
  bool any = false;
  char c;
  while (in.get(c)) {
    any = true;
    if (c == '\n') break;
    if (line.size() == kMaxLine) return LineRead::TooLong;
    line.push_back(c);
  }
  if (!any) return LineRead::End;
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return LineRead::Ok;
}

} // namespace

bool looks_like_text(std::istream& in, int max_lines, bool& text, std::string& msg) {
  text = true;
  RuneScanner scan;
  int lines = 0;
  size_t len = 0;
  char c;
  while (lines < max_lines && in.get(c)) {
    if (c == '\n') {
      if (!scan.flush()) { text = false; return true; }
      ++lines;
      len = 0;
      continue;
    }
    if (++len > kMaxLine) { msg = kTooLong; return false; }
    if (!scan.feed(c)) { text = false; return true; }
  }
  if (in.bad()) {
    msg = "printing regular file: read error";
    return false;
  }
  if (!scan.flush()) text = false;
  return true;
}

bool preview_file(const Window& win, std::istream& in, std::string& msg) {
  bool text = true;
  if (!looks_like_text(in, win.height(), text, msg)) return false;
  if (!text) {
    win.print(0, 0, bold(), "binary");
    return true;
  }

  in.clear();
  in.seekg(0);
  if (!in) {
    msg = "printing regular file: cannot rewind";
    return false;
  }

  std::string line;
  for (int i = 0; i < win.height(); ++i) {
    LineRead r = read_line(in, line);
    if (r == LineRead::End) break;
    if (r == LineRead::TooLong) { msg = kTooLong; return false; }
    win.print(2, i, Style{}, line);
  }
  if (in.bad()) {
    msg = "printing regular file: read error";
    return false;
  }
  return true;
}
