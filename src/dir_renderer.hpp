#pragma once
/*
 * DirRenderer
 *
 * Purpose: draw one directory snapshot into a pane window.
 * Constraint: reads the snapshot only; ind/pos are owned by Nav.
 */
#include <optional>
#include <string>
#include <unordered_set>
#include <sys/types.h>
#include "nav.hpp"
#include "types.hpp"
#include "window.hpp"

struct DirViewport {
  int beg = 0;
  int end = 0;
};

DirViewport dir_viewport(int ind, int pos, int height, int count);

FileKind classify(mode_t mode);
Style kind_style(FileKind kind);

std::optional<ShowInfo> parse_show_info(const std::string& s);

class DirRenderer {
public:
  // Returns false with msg when showinfo is not recognised; the listing is
  // still drawn, without the trailing column.
  bool draw(const Window& win, const Dir& dir, const MarkSet& marks,
            const std::string& showinfo, std::string& msg);

private:
  std::unordered_set<std::string> warned_;
};
