#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Style/Event/FileKind/ShowInfo).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>
#include <string>

enum class Color : std::uint8_t { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

enum Attr : std::uint8_t {
  AttrNone = 0,
  AttrBold = 1 << 0,
  AttrReverse = 1 << 1,
};

struct Style {
  Color fg = Color::Default;
  Color bg = Color::Default;
  std::uint8_t attrs = AttrNone;

  Style reversed() const { Style s = *this; s.attrs ^= AttrReverse; return s; }
  bool operator==(const Style& o) const { return fg == o.fg && bg == o.bg && attrs == o.attrs; }
  bool operator!=(const Style& o) const { return !(*this == o); }
};

inline Style bold(Color fg = Color::Default) { return Style{fg, Color::Default, AttrBold}; }

// Keys the backend reports without a character payload.
enum class Key {
  Char,
  Space,
  Enter,
  Backspace,
  Backspace2,
  Tab,
  Up,
  Down,
  Left,
  Right,
  CtrlL,
  Esc,
  Other,
};

struct Event {
  enum class Type { Key, Resize, None };
  Type type = Type::None;
  Key key = Key::Other;
  char32_t ch = 0; // valid when key == Key::Char
};

inline Event key_event(Key k) { return Event{Event::Type::Key, k, 0}; }
inline Event char_event(char32_t c) { return Event{Event::Type::Key, Key::Char, c}; }
inline Event resize_event() { return Event{Event::Type::Resize, Key::Other, 0}; }

enum class FileKind { RegularExecutable, RegularOther, Directory, Symlink, Fifo, Socket, Device, Other };

enum class ShowInfo { None, Size, Time };
