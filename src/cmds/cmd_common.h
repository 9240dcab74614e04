#pragma once

#include "build_context.h"
#include "cmd.h"

#include <memory>

namespace hijack {

struct manifest;

build_context resolve_build_context(cli_globals const &globals);

std::unique_ptr<manifest> load_manifest_or_throw(cli_globals const &globals,
                                                 build_context const &ctx);

}  // namespace hijack
