#pragma once

#include "cmd.h"
#include "cmds/cmd_deliver.h"
#include "cmds/cmd_plan.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace hijack {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_deliver::cfg, cmd_plan::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cli_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace hijack
