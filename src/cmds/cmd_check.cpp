#include "cmd_check.h"

#include "cmd_common.h"
#include "cookbook.h"
#include "error.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <stdexcept>

namespace larder {

void cmd_check::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("check", "Resolve every recipe and report failures") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--cookbook", cfg_ptr->cookbook_path, "Path to cookbook.lua");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_check::cmd_check(cmd_check::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_check::execute() {
  auto const book{ load_cookbook_or_throw(cfg_.cookbook_path) };
  auto const recipes{ book->recipe_names() };

  size_t invalid{ 0 };
  for (auto const &name : recipes) {
    try {
      resolver::stats stats;
      auto const summary{ book->summarize(name, &stats) };
      tui::debug("%s: %zu ingredient(s), %zu computed, %zu cached",
                 name.c_str(),
                 summary.ingredients.size(),
                 stats.computed,
                 stats.cache_hits);
    } catch (cookbook_error const &e) {
      ++invalid;
      tui::error("%s: %s", name.c_str(), cookbook_error_format(e).c_str());
    }
  }

  tui::print_stdout("check complete: %zu ingredient(s), %zu recipe(s), %zu invalid\n",
                    book->ingredient_count(),
                    recipes.size(),
                    invalid);

  if (invalid) { throw std::runtime_error("check failed"); }
}

}  // namespace larder
