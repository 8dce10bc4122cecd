#pragma once

#include "cmds/cmd_check.h"
#include "cmds/cmd_lua.h"
#include "cmds/cmd_parse.h"
#include "cmds/cmd_summary.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace larder {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_check::cfg,
                                 cmd_lua::cfg,
                                 cmd_parse::cfg,
                                 cmd_summary::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace larder
