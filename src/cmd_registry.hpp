#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands.
 * Design: map name → handler (args vector); Config parses and routes.
 * Names: "set <option>" commands are registered under the two-word name;
 *        command_words() turns a tokenized line into that name plus args.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
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
private:
  std::unordered_map<std::string, Handler> map_;
};

// "mode=binary" -> {"mode", "binary"}; without '=' the value is empty.
inline std::pair<std::string, std::string> split_assignment(const std::string& token) {
  size_t eq = token.find('=');
  if (eq == std::string::npos) return {token, std::string()};
  return {token.substr(0, eq), token.substr(eq + 1)};
}

// {"set", "mode=binary", "x"} -> name "set mode", args {"binary", "x"}.
// Other verbs keep their first word as the name.
inline std::string command_words(const std::vector<std::string>& words, std::vector<std::string>& args) {
  args.clear();
  if (words.empty()) return std::string();
  if (words[0] != "set" || words.size() < 2) {
    args.assign(words.begin() + 1, words.end());
    return words[0];
  }
  auto [opt, value] = split_assignment(words[1]);
  if (!value.empty()) args.push_back(value);
  args.insert(args.end(), words.begin() + 2, words.end());
  return "set " + opt;
}
