#pragma once
/*
 * Config
 *
 * Purpose: session settings and the rc-file loader (~/.slip39crc).
 * Format: one command per line, e.g. "set paper on", "set mode=binary";
 *         '#', '"' and '//' start comment lines; a leading ':' is ignored.
 * Errors: bad lines never abort loading; the last problem is kept in message()
 *         as "file:line: problem".
 */
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "types.hpp"

struct Settings {
  bool paper_mode = false;
  std::optional<InputMode> mode; // nullopt: ask at startup
  bool enable_color = true;
  int carousel_window = 7;
};

class Config {
public:
  Config();

  Settings& settings() { return settings_; }
  const Settings& settings() const { return settings_; }
  const std::string& message() const { return message_; }

  // Returns false (and sets message) on an unknown command or a bad value.
  bool execute(const std::string& line);
  // Returns false when the file exists but cannot be read.
  bool load_file(const std::filesystem::path& path);
  bool load_rc();

  static std::optional<std::filesystem::path> rc_path();

private:
  void register_commands();
  bool set_switch(const std::vector<std::string>& args, bool& target, const std::string& name);

  CommandRegistry registry_;
  Settings settings_;
  std::string message_;
  bool last_ok_ = true;
};
