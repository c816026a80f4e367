#pragma once
/*
 * KeyResolver
 *
 * Purpose: turn terminal events into commands by matching the pending key
 *          sequence against the key map.
 * States: Idle (nothing pending) and Accumulating (prefix of some binding).
 * Resets: dispatch, unknown mapping, unhandled key, escape, resize.
 */
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "command.hpp"
#include "config.hpp"
#include "types.hpp"

// "k" -> "k", Key::Enter -> "<cr>"; nullopt for escape and unhandled keys.
std::optional<std::string> canonical_token(const Event& ev);

class KeyResolver {
public:
  enum class State { Idle, Accumulating };
  enum class Outcome {
    Dispatch, // command holds the bound command
    Pending,  // candidates holds the bindings still reachable
    Reset,    // command is the no-op redraw; message may be set
    Ignored,  // event carried nothing to resolve
  };

  struct Result {
    Outcome outcome = Outcome::Ignored;
    Command command = redraw_command();
    std::vector<std::pair<std::string, Command>> candidates;
    std::string message;
  };

  explicit KeyResolver(const Options& opts) : opts_(opts) {}

  Result feed(const Event& ev);
  void reset();

  State state() const { return pending_.empty() ? State::Idle : State::Accumulating; }
  std::string pending() const;

private:
  const Options& opts_;
  std::vector<std::string> pending_;
};
