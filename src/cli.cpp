#include "cli.hpp"
#include <cctype>
#include <ostream>
#include <vector>
#include "codec.hpp"
#include "prefix_resolver.hpp"

void print_usage(std::ostream& os) {
  os << "SLIP-39 Wordlist Calculator\n\n"
     << "Usage:\n"
     << "  " << kProgramName << " [tui [--paper] [--mode word|binary]]\n"
     << "  " << kProgramName << " encode-word <word> [--prefix]\n"
     << "  " << kProgramName << " decode-bits <bits>\n"
     << "  " << kProgramName << " word-to-index <word> [--prefix]\n"
     << "  " << kProgramName << " index-to-word <index>\n"
     << "  " << kProgramName << " explain <word> [--prefix]\n\n"
     << "Flags:\n"
     << "  -p, --paper       Paper mode: keep only the last selected word.\n"
     << "      --mode M      Start the session in word or binary input.\n"
     << "  -p, --prefix      Accept a unique prefix instead of the full word.\n"
     << "  -h, --help        Show this summary.\n"
     << "  -V, --version     Show the version.\n\n"
     << "Without a command the interactive session starts.\n";
}

static bool command_from_name(const std::string& name, CliCommand& cmd) {
  if (name == "tui") cmd = CliCommand::Tui;
  else if (name == "encode-word") cmd = CliCommand::EncodeWord;
  else if (name == "decode-bits") cmd = CliCommand::DecodeBits;
  else if (name == "word-to-index") cmd = CliCommand::WordToIndex;
  else if (name == "index-to-word") cmd = CliCommand::IndexToWord;
  else if (name == "explain") cmd = CliCommand::Explain;
  else return false;
  return true;
}

static bool takes_word(CliCommand c) {
  return c == CliCommand::EncodeWord || c == CliCommand::WordToIndex || c == CliCommand::Explain;
}

static bool parse_index(const std::string& s, size_t& out) {
  if (s.empty() || s.size() > 9) return false;
  size_t v = 0;
  for (unsigned char c : s) {
    if (!std::isdigit(c)) return false;
    v = v * 10 + static_cast<size_t>(c - '0');
  }
  out = v;
  return true;
}

bool parse_cli(int argc, const char* const* argv, CliOptions& opts, std::string& msg) {
  opts = CliOptions{};
  std::vector<std::string> positional;
  bool have_command = false;
  // flags may come before the subcommand; check them once it is known
  bool paper = false, prefix = false, short_p = false;
  std::string mode_flag;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") { opts.command = CliCommand::Help; return true; }
    if (arg == "--version" || arg == "-V") { opts.command = CliCommand::Version; return true; }
    if (!have_command && !arg.empty() && arg[0] != '-') {
      if (!command_from_name(arg, opts.command)) { msg = "unknown command: " + arg; return false; }
      have_command = true;
      continue;
    }
    if (arg == "--paper") { paper = true; continue; }
    if (arg == "--prefix") { prefix = true; continue; }
    if (arg == "-p") { short_p = true; continue; }
    if (arg == "--mode" || arg.rfind("--mode=", 0) == 0) {
      if (arg == "--mode") {
        if (i + 1 >= argc) { msg = "--mode needs a value (word|binary)"; return false; }
        mode_flag = argv[++i];
      } else {
        mode_flag = arg.substr(7);
      }
      if (mode_flag == "word") opts.mode = InputMode::Word;
      else if (mode_flag == "binary") opts.mode = InputMode::Binary;
      else { msg = "invalid mode '" + mode_flag + "' (expected word|binary)"; return false; }
      continue;
    }
    if (arg.size() > 1 && arg[0] == '-') { msg = "unknown flag: " + arg; return false; }
    positional.push_back(arg);
  }
  bool tui = opts.command == CliCommand::Tui;
  // -p means --paper for the session and --prefix for lookups
  if (short_p) {
    if (tui) paper = true;
    else if (takes_word(opts.command)) prefix = true;
    else { msg = "unexpected flag -p for this command"; return false; }
  }
  if (paper && !tui) { msg = "unexpected flag --paper for this command"; return false; }
  if (prefix && !takes_word(opts.command)) { msg = "unexpected flag --prefix for this command"; return false; }
  if (opts.mode && !tui) { msg = "--mode only applies to tui"; return false; }
  opts.paper = paper;
  opts.prefix = prefix;
  if (opts.command == CliCommand::Tui) {
    if (!positional.empty()) { msg = "unexpected argument: " + positional[0]; return false; }
    return true;
  }
  if (positional.size() != 1) {
    msg = positional.empty() ? "missing argument" : "too many arguments";
    return false;
  }
  opts.argument = positional[0];
  if (opts.command == CliCommand::IndexToWord && !parse_index(opts.argument, opts.index)) {
    msg = "invalid index: " + opts.argument;
    return false;
  }
  return true;
}

static bool find_word(const WordCatalog& catalog, const CliOptions& opts, std::string& word, LookupError& e) {
  PrefixResolver resolver(catalog);
  if (opts.prefix) return resolver.resolve_word(opts.argument, word, e);
  return resolver.find_exact(opts.argument, word, e);
}

int run_command(const CliOptions& opts, const WordCatalog& catalog, std::ostream& out, std::ostream& err) {
  std::string result;
  std::string word;
  LookupError e;
  bool ok = false;
  switch (opts.command) {
    case CliCommand::Help: print_usage(out); return kExitOk;
    case CliCommand::Version: out << kProgramName << " " << kVersion << "\n"; return kExitOk;
    case CliCommand::Tui: print_usage(err); return kExitUsage;
    case CliCommand::EncodeWord:
      ok = find_word(catalog, opts, word, e) && encode_word(catalog, word, result, e);
      break;
    case CliCommand::DecodeBits:
      ok = decode_bits(catalog, opts.argument, result, e);
      break;
    case CliCommand::WordToIndex:
      if ((ok = find_word(catalog, opts, word, e))) {
        auto idx = catalog.lookup_exact(word);
        result = std::to_string(idx.value_or(0));
      }
      break;
    case CliCommand::IndexToWord:
      ok = word_at_index(catalog, opts.index, result, e);
      break;
    case CliCommand::Explain:
      ok = find_word(catalog, opts, word, e) && explain_word(catalog, word, result, e);
      break;
  }
  if (!ok) {
    err << "Error: " << e.message << "\n";
    return kExitLookupError;
  }
  out << result << "\n";
  return kExitOk;
}
