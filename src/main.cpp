#include "cli.h"
#include "error.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  larder::tui::init();

  auto args{ larder::cli_parse(argc, argv) };
  larder::tui::configure_trace_outputs(args.trace_outputs);
  larder::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      larder::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    larder::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return larder::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (larder::cookbook_error const &ex) {
    larder::tui::error("error: %s", larder::cookbook_error_format(ex).c_str());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    larder::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
