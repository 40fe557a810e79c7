#pragma once
/*
 * CommandRegistry
 *
 * Purpose: the pager's ":" commands, by name.
 * Design: name → handler (args vector); aliases resolve to a registered name.
 *         Pager splits the line and routes; options are registered as "set <name>" so
 *         `set name=value` and `set name value` reach the same handler.
 */
#include <algorithm>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;

  void register_command(const std::string& name, Handler h) { handlers_[name] = std::move(h); }
  void register_alias(const std::string& alias, const std::string& target) { aliases_[alias] = target; }

  // false when nothing is registered under name
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto a = aliases_.find(name);
    const std::string& key = a == aliases_.end() ? name : a->second;
    auto it = handlers_.find(key);
    if (it == handlers_.end()) return false;
    it->second(args);
    return true;
  }

  // registered names (aliases excluded), sorted
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& kv : handlers_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  std::unordered_map<std::string, Handler> handlers_;
  std::unordered_map<std::string, std::string> aliases_;
};
