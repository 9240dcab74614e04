#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace hijack {

class cmd_deliver : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_deliver> {
    bool no_directives{ false };
    std::filesystem::path staging_parent;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_deliver(cfg cfg, cli_globals const &globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cli_globals globals_;
};

}  // namespace hijack
