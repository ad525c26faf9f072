#pragma once
/*
 * Cli
 *
 * Purpose: parse command-line arguments and run the single-shot lookup
 *          subcommands (encode-word, decode-bits, word-to-index,
 *          index-to-word, explain).
 * Exit status: 0 success; 1 lookup error ("Error: ..." on stderr);
 *              2 usage error.
 */
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include "types.hpp"
#include "word_catalog.hpp"

inline constexpr std::string_view kProgramName = "slip39c";
inline constexpr std::string_view kVersion = "0.2.0";

enum class CliCommand { Tui, EncodeWord, DecodeBits, WordToIndex, IndexToWord, Explain, Help, Version };

struct CliOptions {
  CliCommand command = CliCommand::Tui;
  std::string argument;           // word or bit string
  size_t index = 0;               // index-to-word
  bool prefix = false;            // allow unique-prefix lookup
  bool paper = false;             // tui
  std::optional<InputMode> mode;  // tui
};

inline constexpr int kExitOk = 0;
inline constexpr int kExitLookupError = 1;
inline constexpr int kExitUsage = 2;

bool parse_cli(int argc, const char* const* argv, CliOptions& opts, std::string& msg);
void print_usage(std::ostream& os);
// Runs every command except Tui; returns the process exit status.
int run_command(const CliOptions& opts, const WordCatalog& catalog, std::ostream& out, std::ostream& err);
