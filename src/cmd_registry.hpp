#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch ex-style commands (typed after ':' or read
 *          from the rc file).
 * Design: map name → handler (args vector); Viewer parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void register_alias(const std::string& alias, const std::string& name) {
    auto it = map_.find(name);
    if (it != map_.end()) map_[alias] = it->second;
  }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
