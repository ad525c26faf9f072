#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "terminal.hpp"
#include "word_catalog.hpp"
#include <iostream>

int main(int argc, char** argv) {
  CliOptions opts; std::string msg;
  if (!parse_cli(argc, argv, opts, msg)) {
    std::cerr << kProgramName << ": " << msg << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
  }
  const WordCatalog& catalog = default_catalog();
  if (opts.command != CliCommand::Tui) return run_command(opts, catalog, std::cout, std::cerr);

  Config config;
  if (!config.load_rc()) std::cerr << kProgramName << ": " << config.message() << "\n";
  Settings settings = config.settings();
  if (opts.paper) settings.paper_mode = true;
  if (opts.mode) settings.mode = opts.mode;

  Terminal screen(settings.enable_color);
  App app(catalog, settings, screen, config.message());
  app.run();
  return kExitOk;
}
