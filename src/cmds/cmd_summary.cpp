#include "cmd_summary.h"

#include "cmd_common.h"
#include "cookbook.h"
#include "error.h"
#include "summary.h"
#include "tui.h"

#include "CLI11.hpp"
#include "tbb/task_group.h"

#include <memory>
#include <stdexcept>
#include <variant>

namespace larder {

void cmd_summary::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("summary", "Print ingredient summaries of recipes") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("names", cfg_ptr->names, "Recipe names to summarize");
  sub->add_flag("--all", cfg_ptr->all, "Summarize every recipe in the cookbook");
  sub->add_flag("--json", cfg_ptr->json, "Print one JSON object per recipe");
  sub->add_option("--cookbook", cfg_ptr->cookbook_path, "Path to cookbook.lua");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_summary::cmd_summary(cmd_summary::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_summary::execute() {
  auto const book{ load_cookbook_or_throw(cfg_.cookbook_path) };

  auto names{ cfg_.names };
  if (cfg_.all) {
    for (auto &name : book->recipe_names()) { names.push_back(std::move(name)); }
  }
  if (names.empty()) { throw std::runtime_error("summary: no recipe names (use --all)"); }

  // Each slot holds the summary or the formatted failure for that request.
  using outcome_t = std::variant<recipe_summary, std::string>;
  std::vector<outcome_t> outcomes(names.size());

  tbb::task_group tg;
  for (size_t i{}; i < names.size(); ++i) {
    tg.run([&, i]() {
      try {
        outcomes[i] = book->summarize(names[i]);
      } catch (cookbook_error const &e) {
        outcomes[i] = cookbook_error_format(e);
      } catch (std::exception const &e) { outcomes[i] = std::string{ e.what() }; }
    });
  }
  tg.wait();

  size_t failed{ 0 };
  for (size_t i{}; i < names.size(); ++i) {
    std::visit(match{ [&](recipe_summary const &summary) {
                       if (cfg_.json) {
                         tui::print_stdout("%s\n", summary_to_json(summary).c_str());
                       } else {
                         tui::print_stdout("%s", summary_to_text(summary).c_str());
                       }
                     },
                      [&](std::string const &err) {
                        ++failed;
                        tui::error("%s: %s", names[i].c_str(), err.c_str());
                      } },
               outcomes[i]);
  }

  if (failed) {
    throw std::runtime_error("summary: " + std::to_string(failed) + " of " +
                             std::to_string(names.size()) + " recipe(s) failed");
  }
}

}  // namespace larder
