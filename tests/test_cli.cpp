#include "cli.hpp"
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

static bool parse(std::vector<const char*> args, CliOptions& o, std::string& msg) {
  args.insert(args.begin(), "slip39c");
  return parse_cli(static_cast<int>(args.size()), args.data(), o, msg);
}

struct Result { int code; std::string out; std::string err; };

static Result run(std::vector<const char*> args) {
  CliOptions o; std::string msg;
  bool ok = parse(std::move(args), o, msg);
  assert(ok);
  std::ostringstream out, err;
  int code = run_command(o, default_catalog(), out, err);
  return {code, out.str(), err.str()};
}

static void test_parse() {
  CliOptions o; std::string msg;
  assert(parse({}, o, msg) && o.command == CliCommand::Tui && !o.paper && !o.mode);
  assert(parse({"tui", "-p", "--mode", "binary"}, o, msg));
  assert(o.command == CliCommand::Tui && o.paper && o.mode == InputMode::Binary);
  assert(parse({"--paper", "--mode=word"}, o, msg) && o.paper && o.mode == InputMode::Word);
  assert(parse({"encode-word", "aca", "--prefix"}, o, msg));
  assert(o.command == CliCommand::EncodeWord && o.prefix && o.argument == "aca");
  assert(parse({"index-to-word", "42"}, o, msg) && o.index == 42);
  assert(parse({"decode-bits", "-h"}, o, msg) && o.command == CliCommand::Help);

  assert(!parse({"frobnicate"}, o, msg) && msg == "unknown command: frobnicate");
  assert(!parse({"encode-word"}, o, msg) && msg == "missing argument");
  assert(!parse({"encode-word", "a", "b"}, o, msg) && msg == "too many arguments");
  assert(!parse({"index-to-word", "4x"}, o, msg));
  assert(!parse({"tui", "--mode", "hex"}, o, msg));
  assert(!parse({"tui", "--mode"}, o, msg));
  assert(!parse({"decode-bits", "--mode", "word", "0"}, o, msg));
  assert(!parse({"decode-bits", "-p", "0000000000"}, o, msg));
  assert(!parse({"encode-word", "--paper", "acid"}, o, msg));
  assert(!parse({"tui", "extra"}, o, msg));
  assert(!parse({"--bogus"}, o, msg));
}

static void test_flags_before_command() {
  CliOptions o; std::string msg;
  assert(parse({"-p", "encode-word", "zer"}, o, msg));
  assert(o.command == CliCommand::EncodeWord && o.prefix && !o.paper);
  assert(parse({"--prefix", "explain", "aca"}, o, msg) && o.prefix);
  assert(parse({"-p", "tui"}, o, msg) && o.command == CliCommand::Tui && o.paper);
  assert(parse({"--mode", "binary", "tui"}, o, msg) && o.mode == InputMode::Binary);
  assert(!parse({"-p", "decode-bits", "0000000000"}, o, msg));
  assert(msg == "unexpected flag -p for this command");
  assert(!parse({"--paper", "word-to-index", "acid"}, o, msg));
  assert(!parse({"--mode=word", "explain", "acid"}, o, msg) && msg == "--mode only applies to tui");
  assert(!parse({"--prefix"}, o, msg));

  auto r = run({"-p", "encode-word", "zer"});
  assert(r.code == kExitOk && r.out == "1111111111\n");
}

static void test_commands() {
  auto r = run({"encode-word", "acid"});
  assert(r.code == kExitOk && r.out == "0000000001\n" && r.err.empty());
  r = run({"encode-word", "ACADEMIC"});
  assert(r.code == kExitOk && r.out == "0000000000\n");
  r = run({"decode-bits", "1111111111"});
  assert(r.code == kExitOk && r.out == "zero\n");
  r = run({"word-to-index", "zero"});
  assert(r.code == kExitOk && r.out == "1023\n");
  r = run({"index-to-word", "1"});
  assert(r.code == kExitOk && r.out == "acid\n");
  r = run({"explain", "acid"});
  assert(r.code == kExitOk && r.out == "acid -> 1 -> 0000000001\n");
}

static void test_prefix_lookups() {
  auto r = run({"encode-word", "zer"});
  assert(r.code == kExitLookupError);
  assert(r.err == "Error: Word 'zer' not found in SLIP-39 wordlist\n");
  r = run({"encode-word", "zer", "--prefix"});
  assert(r.code == kExitOk && r.out == "1111111111\n");
  r = run({"explain", "-p", "  ACA "});
  assert(r.code == kExitOk && r.out == "academic -> 0 -> 0000000000\n");
  r = run({"word-to-index", "ac", "-p"});
  assert(r.code == kExitLookupError && r.out.empty());
  assert(r.err.rfind("Error: Ambiguous prefix 'ac' matches 7 words: ", 0) == 0);
  r = run({"word-to-index", "xyz", "--prefix"});
  assert(r.code == kExitLookupError);
  assert(r.err.find("'xyz' not found") != std::string::npos);
}

static void test_codec_errors() {
  auto r = run({"decode-bits", "0101"});
  assert(r.code == kExitLookupError);
  assert(r.err == "Error: Binary must be exactly 10 bits, got 4 bits\n");
  r = run({"decode-bits", "01010abcde"});
  assert(r.code == kExitLookupError);
  assert(r.err.find("Invalid binary string") != std::string::npos);
  r = run({"index-to-word", "1024"});
  assert(r.code == kExitLookupError);
  assert(r.err == "Error: Index 1024 out of wordlist range (0-1023)\n");
}

static void test_help_and_version() {
  auto r = run({"--help"});
  assert(r.code == kExitOk && r.out.find("Usage:") != std::string::npos);
  r = run({"-V"});
  assert(r.code == kExitOk && r.out == std::string(kProgramName) + " " + std::string(kVersion) + "\n");
}

int main() {
  test_parse();
  test_flags_before_command();
  test_commands();
  test_prefix_lookups();
  test_codec_errors();
  test_help_and_version();
  return 0;
}
