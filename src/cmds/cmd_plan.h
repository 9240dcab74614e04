#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace hijack {

// Dry run: resolves each package's source and target without fetching or writing.
class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_plan(cfg cfg, cli_globals const &globals);

  bool execute() override;

 private:
  cfg cfg_;
  cli_globals globals_;
};

}  // namespace hijack
