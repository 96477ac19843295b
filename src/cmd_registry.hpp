#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch ex-style commands.
 * Design: map name → handler (args vector); handlers report through Status.
 * `set <option>` lines dispatch to the composite name "set <option>".
 */
#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "status.hpp"

class CommandRegistry {
public:
  using Handler = std::function<Status(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  // false when no command has this name
  bool execute(const std::string& name, const std::vector<std::string>& args, Status& st) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    st = it->second(args);
    return true;
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& [name, h] : map_) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
