#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch commands by name.
 * Design: map name → handler (args vector); App parses and routes.
 * Note: ordered map so completion candidates come out sorted.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  std::vector<std::string> names_with_prefix(const std::string& prefix) const {
    std::vector<std::string> out;
    for (auto it = map_.lower_bound(prefix); it != map_.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) break;
      out.push_back(it->first);
    }
    return out;
  }
private:
  std::map<std::string, Handler> map_;
};
