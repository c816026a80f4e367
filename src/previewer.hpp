#pragma once
/*
 * Previewer
 *
 * Purpose: draw the first lines of a regular file, or a "binary" placeholder.
 * Usage: preview_file(win, stream, msg); returns false with msg on read failure.
 * Note: the stream must be seekable; it is rewound once between scan and draw.
 *       Lines longer than 64 KiB are refused with a status message.
 */
#include <istream>
#include <string>
#include "window.hpp"

// Scans up to max_lines lines; text becomes false at the first code point
// that is neither whitespace nor printable, and reading stops right after it.
bool looks_like_text(std::istream& in, int max_lines, bool& text, std::string& msg);

bool preview_file(const Window& win, std::istream& in, std::string& msg);
