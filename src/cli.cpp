#include "cli.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hijack {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "hijack - inject prebuilt artifacts over dummy build outputs" };
  app.fallthrough();

  cli_args args{};

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  app.add_option("--manifest",
                 args.globals.manifest_path,
                 "Path to hijack.lua (defaults to <project-root>/hijack.lua)");
  app.add_option("--project-root",
                 args.globals.context.project_root,
                 "Project root (overrides CARGO_MANIFEST_DIR)");
  app.add_option("--deps-dir",
                 args.globals.context.deps_dir,
                 "Directory holding the dummy artifacts (overrides HIJACK_DEPS_DIR)");
  app.add_option("--out-dir",
                 args.globals.context.out_dir,
                 "Build script output directory (overrides OUT_DIR)");
  app.add_option("--target",
                 args.globals.context.target_triple,
                 "Target triple (overrides TARGET)");
  app.add_option("--profile",
                 args.globals.context.profile,
                 "Build profile (overrides PROFILE)");
  app.add_option("--compiler-version",
                 args.globals.context.compiler_version,
                 "Compiler version (overrides HIJACK_COMPILER_VERSION)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;

  cmd_deliver::register_cli(app, [&cmd_cfg](cmd_deliver::cfg cfg) { cmd_cfg = cfg; });
  cmd_plan::register_cli(app, [&cmd_cfg](cmd_plan::cfg cfg) { cmd_cfg = cfg; });
  cmd_version::register_cli(app, [&cmd_cfg](cmd_version::cfg cfg) { cmd_cfg = cfg; });

  bool parse_failed{ false };
  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    parse_failed = true;
  } catch (CLI::ParseError const &e) {
    args.cli_output = std::string(e.what());
    parse_failed = true;
  }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (parse_failed) { return args; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  args.cmd_cfg = cmd_cfg ? *cmd_cfg : cli_args::cmd_cfg_t{ cmd_deliver::cfg{} };
  return args;
}

}  // namespace hijack
