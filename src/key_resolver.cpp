#include "key_resolver.hpp"
#include <spdlog/spdlog.h>
#include "text_util.hpp"

std::optional<std::string> canonical_token(const Event& ev) {
  if (ev.type != Event::Type::Key) return std::nullopt;
  switch (ev.key) {
    case Key::Char: return utf8_encode(ev.ch);
    case Key::Space: return std::string("<space>");
    case Key::Enter: return std::string("<cr>");
    case Key::Backspace: return std::string("<bs>");
    case Key::Backspace2: return std::string("<bs2>");
    case Key::Tab: return std::string("<tab>");
    case Key::Up: return std::string("<up>");
    case Key::Down: return std::string("<down>");
    case Key::Left: return std::string("<left>");
    case Key::Right: return std::string("<right>");
    case Key::CtrlL: return std::string("<c-l>");
    case Key::Esc:
    case Key::Other:
      break;
  }
  return std::nullopt;
}

std::string KeyResolver::pending() const {
  std::string s;
  for (const auto& t : pending_) s += t;
  return s;
}

void KeyResolver::reset() { pending_.clear(); }

KeyResolver::Result KeyResolver::feed(const Event& ev) {
  Result res;
  if (ev.type == Event::Type::None) return res;

  if (ev.type == Event::Type::Resize || ev.key == Key::Esc) {
    reset();
    res.outcome = Outcome::Reset;
    return res;
  }

  std::optional<std::string> tok = canonical_token(ev);
  if (!tok) {
    reset();
    res.outcome = Outcome::Reset;
    res.message = "unhandled key";
    return res;
  }
  pending_.push_back(*tok);

  const std::string seq = pending();
  const Command* exact = nullptr;
  for (auto it = opts_.keys.lower_bound(seq); it != opts_.keys.end(); ++it) {
    if (it->first.compare(0, seq.size(), seq) != 0) break;
    if (it->first == seq) exact = &it->second;
    res.candidates.emplace_back(it->first, it->second);
  }

  if (res.candidates.empty()) {
    res.outcome = Outcome::Reset;
    res.message = "unknown mapping: " + seq;
    reset();
    return res;
  }
  if (exact) {
    // Longer bindings sharing this prefix are unreachable; dispatch now.
    res.outcome = Outcome::Dispatch;
    res.command = *exact;
    res.candidates.clear();
    spdlog::debug("dispatch {} -> {}", seq, exact->describe());
    reset();
    return res;
  }
  res.outcome = Outcome::Pending;
  return res;
}
