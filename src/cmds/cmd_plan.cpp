#include "cmd_plan.h"

#include "cmd_common.h"
#include "engine.h"
#include "manifest.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <string>

namespace hijack {

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan",
                                "Show where each package would come from and what it "
                                "would replace") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg, cli_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

bool cmd_plan::execute() {
  auto const ctx{ resolve_build_context(globals_) };
  auto const m{ load_manifest_or_throw(globals_, ctx) };

  bool ok{ true };
  for (auto const &plan : engine_plan(m->config, ctx, { .emit_directives = false })) {
    if (plan.failure) {
      ok = false;
      tui::print_stdout("%s\terror\t%.*s: %s\n",
                        plan.name.c_str(),
                        static_cast<int>(error_kind_name(plan.failure->kind).size()),
                        error_kind_name(plan.failure->kind).data(),
                        plan.failure->message.c_str());
      continue;
    }

    auto const placement{ placement_name(plan.spec.placement) };
    tui::print_stdout("%s\t%s\t%.*s\t%s\n",
                      plan.name.c_str(),
                      plan.locator->location.c_str(),
                      static_cast<int>(placement.size()),
                      placement.data(),
                      plan.target.string().c_str());
  }
  return ok;
}

}  // namespace hijack
