#include "cmd_lua.h"

#include "cmd_common.h"
#include "cookbook.h"
#include "lua_larder.h"
#include "sol_util.h"

#include "CLI11.hpp"
#include "sol/sol.hpp"

#include <memory>
#include <stdexcept>

namespace larder {

void cmd_lua::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("lua", "Execute Lua script against a cookbook") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("script", cfg_ptr->script_path, "Lua script file to execute")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--cookbook", cfg_ptr->cookbook_path, "Cookbook to preload");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_lua::cmd_lua(cmd_lua::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_lua::execute() {
  auto const book{ cfg_.cookbook_path ? load_cookbook_or_throw(cfg_.cookbook_path)
                                      : std::make_unique<cookbook>() };

  auto lua{ sol_util_make_lua_state() };
  lua_larder_install(*lua, book.get());

  sol::protected_function_result result =
      lua->safe_script_file(cfg_.script_path.string(), sol::script_pass_on_error);
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }
}

}  // namespace larder
