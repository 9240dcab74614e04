#include "cmd_common.h"

#include "manifest.h"

#include <stdexcept>

namespace hijack {

build_context resolve_build_context(cli_globals const &globals) {
  return build_context_from_env(globals.context);
}

std::unique_ptr<manifest> load_manifest_or_throw(cli_globals const &globals,
                                                 build_context const &ctx) {
  auto const path{ manifest::find_manifest_path(globals.manifest_path, ctx.project_root) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

}  // namespace hijack
