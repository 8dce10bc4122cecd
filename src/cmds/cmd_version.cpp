#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <memory>

#ifndef LARDER_VERSION_STR
#error "LARDER_VERSION_STR must be defined by the build system"
#endif

namespace larder {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("larder version %s", LARDER_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace larder
