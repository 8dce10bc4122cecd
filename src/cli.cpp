#include "cli.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace larder {

namespace {

// Split "stderr,file:/tmp/t.jsonl" into trace outputs. Returns false on a bad token.
bool parse_trace_spec(std::string const &trace_spec,
                      std::vector<tui::trace_output_spec> &outputs,
                      std::string &bad_token) {
  if (trace_spec.empty()) {
    outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    return true;
  }

  for (std::string_view sv{ trace_spec }; !sv.empty();) {
    auto const pos{ sv.find(',') };
    std::string const token{ sv.substr(0, pos) };
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);

    if (token.empty()) { continue; }
    if (token == "stderr") {
      outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
    } else if (token.rfind("file:", 0) == 0 && token.size() > 5) {
      outputs.push_back(
          { tui::trace_output_type::file, std::filesystem::path{ token.substr(5) } });
    } else {
      bad_token = token;
      return false;
    }
  }

  if (outputs.empty()) {
    outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
  }
  return true;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "larder - cookbook registry and recipe resolver" };
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const select{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_parse::register_cli(app, select);
  cmd_summary::register_cli(app, select);
  cmd_check::register_cli(app, select);
  cmd_lua::register_cli(app, select);
  cmd_version::register_cli(app, select);

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (trace_option->count() > 0) {
    std::string bad_token;
    if (!parse_trace_spec(trace_spec, args.trace_outputs, bad_token)) {
      args.cli_output = "Invalid trace output spec: " + bad_token;
      args.trace_outputs.clear();
      return args;
    }
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace larder
