#include "cmd_deliver.h"

#include "cmd_common.h"
#include "engine.h"
#include "manifest.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace hijack {

void cmd_deliver::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("deliver",
                                "Fetch prebuilt artifacts and inject them over the "
                                "dummy outputs (default)") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_flag("--no-directives",
                cfg_ptr->no_directives,
                "Do not print cargo: directives on stdout");
  sub->add_option("--staging-dir",
                  cfg_ptr->staging_parent,
                  "Parent directory for temporary downloads (defaults to system temp)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_deliver::cmd_deliver(cmd_deliver::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_deliver::execute() {
  auto const ctx{ resolve_build_context(globals_) };
  auto const m{ load_manifest_or_throw(globals_, ctx) };

  if (m->config.packages.empty()) {
    tui::info("%s declares no packages", m->manifest_path.string().c_str());
    return true;
  }

  deliver_options const options{ .emit_directives = !cfg_.no_directives,
                                 .staging_parent = cfg_.staging_parent };
  auto const report{ deliver(m->config, ctx, options) };
  if (!report.ok()) {
    tui::error("%s", report.summary().c_str());
    return false;
  }
  return true;
}

}  // namespace hijack
