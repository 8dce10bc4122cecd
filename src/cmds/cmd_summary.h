#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace larder {

class cmd_summary : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_summary> {
    std::vector<std::string> names;
    bool all{ false };
    bool json{ false };
    std::optional<std::filesystem::path> cookbook_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_summary(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace larder
