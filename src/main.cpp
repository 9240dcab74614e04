#include "cli.h"
#include "hijack_error.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  hijack::tui::init();

  auto args{ hijack::cli_parse(argc, argv) };
  hijack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      hijack::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    hijack::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return hijack::cmd::create(cfg, args.globals); },
      *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (hijack::hijack_error const &ex) {
    hijack::tui::error("%.*s error: %s",
                       static_cast<int>(hijack::error_category_name(ex.category()).size()),
                       hijack::error_category_name(ex.category()).data(),
                       ex.what());
    return EXIT_FAILURE;
  } catch (std::exception const &ex) {
    hijack::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
