#include "cmd_parse.h"

#include "normalize.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace larder {

void cmd_parse::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("parse", "Normalize a handwritten recipe name") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("text", cfg_ptr->text, "Free-form name to normalize")->required();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_parse::cmd_parse(cmd_parse::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_parse::execute() {
  auto const name{ normalize_name_or_throw(cfg_.text) };
  tui::print_stdout("%s\n", name.c_str());
}

}  // namespace larder
