#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>
#include "file_reader.hpp"
#include "query.hpp"

static constexpr int kMaxCarouselWindow = 15;

Config::Config() {
  register_commands();
}

bool Config::set_switch(const std::vector<std::string>& args, bool& target, const std::string& name) {
  if (args.empty()) { target = !target; message_ = name + (target ? " on" : " off"); return true; }
  const std::string& opt = args[0];
  if (opt == "on") { target = true; message_ = name + " on"; return true; }
  if (opt == "off") { target = false; message_ = name + " off"; return true; }
  message_ = "set " + name + ": use :set " + name + " on|off";
  return false;
}

void Config::register_commands() {
  registry_.register_command("set paper", [this](const std::vector<std::string>& args){
    last_ok_ = set_switch(args, settings_.paper_mode, "paper");
  });
  registry_.register_command("set color", [this](const std::vector<std::string>& args){
    last_ok_ = set_switch(args, settings_.enable_color, "color");
  });
  registry_.register_command("set mode", [this](const std::vector<std::string>& args){
    last_ok_ = true;
    std::string v = args.empty() ? std::string() : args[0];
    if (v == "word") { settings_.mode = InputMode::Word; message_ = "mode word"; }
    else if (v == "binary") { settings_.mode = InputMode::Binary; message_ = "mode binary"; }
    else if (v == "ask") { settings_.mode.reset(); message_ = "mode ask"; }
    else { message_ = "set mode: use :set mode word|binary|ask"; last_ok_ = false; }
  });
  registry_.register_command("set window", [this](const std::vector<std::string>& args){
    last_ok_ = false;
    if (args.empty()) { message_ = "set window: use :set window <odd number>"; return; }
    const std::string& s = args[0];
    bool digits = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!digits || s.size() > 3) { message_ = "set window: width must be a number"; return; }
    int w = std::stoi(s);
    if (w < 1 || w > kMaxCarouselWindow || w % 2 == 0) {
      message_ = "set window: width must be odd, 1.." + std::to_string(kMaxCarouselWindow);
      return;
    }
    settings_.carousel_window = w;
    message_ = "window " + s;
    last_ok_ = true;
  });
}

bool Config::execute(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> words; std::string w;
  while (iss >> w) words.push_back(normalize_query(w));
  std::vector<std::string> args;
  std::string name = command_words(words, args);
  if (!registry_.execute(name, args)) { message_ = "unknown command: " + name; return false; }
  return last_ok_;
}

std::optional<std::filesystem::path> Config::rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / ".slip39crc";
}

bool Config::load_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<NumberedLine> lines; std::string msg;
  if (!read_numbered_lines(path, lines, msg)) { message_ = msg; return false; }
  std::string last_error;
  for (const NumberedLine& line : lines) {
    std::string s = trim_query(line.text);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.starts_with("//")) continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!execute(s)) {
      last_error = path.filename().string() + ":" + std::to_string(line.number) + ": " + message_;
    }
  }
  message_ = last_error.empty() ? msg : last_error;
  return true;
}

bool Config::load_rc() {
  auto p = rc_path();
  if (!p) return true;
  return load_file(*p);
}
