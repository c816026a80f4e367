#include "key_resolver.hpp"
#include <cassert>
#include <initializer_list>
#include <string>
#include <utility>

using Outcome = KeyResolver::Outcome;
using State = KeyResolver::State;

static Options opts_with(std::initializer_list<std::pair<const std::string, std::string>> binds) {
  Options o;
  for (const auto& b : binds) o.keys[b.first] = parse_command(b.second);
  return o;
}

static void test_two_key_sequence() {
  Options o = opts_with({{"gg", "top"}});
  KeyResolver kr(o);
  auto r = kr.feed(char_event(U'g'));
  assert(r.outcome == Outcome::Pending);
  assert(kr.state() == State::Accumulating);
  assert(kr.pending() == "g");
  assert(r.candidates.size() == 1);
  assert(r.candidates[0].first == "gg");
  r = kr.feed(char_event(U'g'));
  assert(r.outcome == Outcome::Dispatch);
  assert(r.command.name == "top");
  assert(kr.state() == State::Idle);
}

static void test_unknown_mapping_resets() {
  Options o = opts_with({{"gg", "top"}, {"j", "down"}});
  KeyResolver kr(o);
  auto r = kr.feed(char_event(U'x'));
  assert(r.outcome == Outcome::Reset);
  assert(r.command == redraw_command());
  assert(r.message == "unknown mapping: x");
  assert(kr.state() == State::Idle);

  kr.feed(char_event(U'g'));
  r = kr.feed(char_event(U'j'));
  assert(r.outcome == Outcome::Reset);
  assert(r.message == "unknown mapping: gj");
  assert(kr.state() == State::Idle);
}

static void test_escape_and_resize_always_reset() {
  Options o = opts_with({{"abc", "x"}, {"abd", "y"}});
  KeyResolver kr(o);
  kr.feed(char_event(U'a'));
  kr.feed(char_event(U'b'));
  assert(kr.state() == State::Accumulating);
  auto r = kr.feed(key_event(Key::Esc));
  assert(r.outcome == Outcome::Reset);
  assert(r.command == redraw_command());
  assert(r.message.empty());
  assert(kr.state() == State::Idle);

  kr.feed(char_event(U'a'));
  r = kr.feed(resize_event());
  assert(r.outcome == Outcome::Reset);
  assert(r.command == redraw_command());
  assert(kr.state() == State::Idle);

  r = kr.feed(key_event(Key::Esc));
  assert(r.outcome == Outcome::Reset);
}

static void test_unhandled_key() {
  Options o = opts_with({{"ab", "x"}});
  KeyResolver kr(o);
  assert(kr.feed(char_event(U'a')).outcome == Outcome::Pending);
  auto r = kr.feed(key_event(Key::Other));
  assert(r.outcome == Outcome::Reset);
  assert(r.message == "unhandled key");
  assert(kr.state() == State::Idle);
}

static void test_exact_match_wins_over_longer() {
  Options o = opts_with({{"g", "one"}, {"gg", "two"}, {"gh", "three"}});
  KeyResolver kr(o);
  auto r = kr.feed(char_event(U'g'));
  assert(r.outcome == Outcome::Dispatch);
  assert(r.command.name == "one");
  assert(kr.state() == State::Idle);
}

static void test_several_candidates_without_exact() {
  Options o = opts_with({{"za", "a"}, {"zb", "b"}, {"y", "c"}});
  KeyResolver kr(o);
  auto r = kr.feed(char_event(U'z'));
  assert(r.outcome == Outcome::Pending);
  assert(r.candidates.size() == 2);
  assert(r.candidates[0].first == "za" && r.candidates[1].first == "zb");
  r = kr.feed(char_event(U'b'));
  assert(r.outcome == Outcome::Dispatch);
  assert(r.command.name == "b");
}

static void test_named_key_tokens() {
  assert(*canonical_token(key_event(Key::Space)) == "<space>");
  assert(*canonical_token(key_event(Key::Enter)) == "<cr>");
  assert(*canonical_token(key_event(Key::Backspace)) == "<bs>");
  assert(*canonical_token(key_event(Key::Backspace2)) == "<bs2>");
  assert(*canonical_token(key_event(Key::Tab)) == "<tab>");
  assert(*canonical_token(key_event(Key::Up)) == "<up>");
  assert(*canonical_token(key_event(Key::Down)) == "<down>");
  assert(*canonical_token(key_event(Key::Left)) == "<left>");
  assert(*canonical_token(key_event(Key::Right)) == "<right>");
  assert(*canonical_token(key_event(Key::CtrlL)) == "<c-l>");
  assert(*canonical_token(char_event(U'é')) == "\xC3\xA9");
  assert(!canonical_token(key_event(Key::Esc)));
  assert(!canonical_token(key_event(Key::Other)));

  Options o = opts_with({{"<space><cr>", "toggle"}});
  KeyResolver kr(o);
  assert(kr.feed(key_event(Key::Space)).outcome == Outcome::Pending);
  auto r = kr.feed(key_event(Key::Enter));
  assert(r.outcome == Outcome::Dispatch && r.command.name == "toggle");
}

static void test_none_event_is_ignored() {
  Options o = opts_with({{"gg", "top"}});
  KeyResolver kr(o);
  kr.feed(char_event(U'g'));
  assert(kr.feed(Event{}).outcome == Outcome::Ignored);
  assert(kr.pending() == "g");
}

static void test_default_bindings() {
  Options o = default_options();
  KeyResolver kr(o);
  auto r = kr.feed(char_event(U'j'));
  assert(r.outcome == Outcome::Dispatch && r.command.name == "down");
  r = kr.feed(char_event(U'G'));
  assert(r.outcome == Outcome::Dispatch && r.command.name == "bottom");
}

int main() {
  test_two_key_sequence();
  test_unknown_mapping_resets();
  test_escape_and_resize_always_reset();
  test_unhandled_key();
  test_exact_match_wins_over_longer();
  test_several_candidates_without_exact();
  test_named_key_tokens();
  test_none_event_is_ignored();
  test_default_bindings();
  return 0;
}
