#include "build_context.h"

#include "hijack_error.h"
#include "platform.h"
#include "tui.h"

#include <string>

namespace hijack {
namespace {

constexpr int kOutDirDepth{ 3 };

std::string require_value(std::optional<std::string> const &override_value,
                          char const *env_name) {
  if (override_value) { return *override_value; }
  if (auto value{ platform::env_var_get(env_name) }; value && !value->empty()) {
    return *value;
  }
  throw hijack_error(error_kind::invalid_build_context,
                     std::string("Undefined environment variable '") + env_name + "'");
}

std::filesystem::path resolve_deps_dir(build_context_overrides const &overrides) {
  if (overrides.deps_dir) { return *overrides.deps_dir; }
  if (auto env_deps{ platform::env_var_get("HIJACK_DEPS_DIR") };
      env_deps && !env_deps->empty()) {
    return *env_deps;
  }

  if (overrides.out_dir) { return build_context_deps_dir_from_out_dir(*overrides.out_dir); }
  if (auto out_dir{ platform::env_var_get("OUT_DIR") }; out_dir && !out_dir->empty()) {
    return build_context_deps_dir_from_out_dir(*out_dir);
  }

  throw hijack_error(error_kind::invalid_build_context,
                     "Undefined environment variable 'OUT_DIR' (or 'HIJACK_DEPS_DIR')");
}

}  // namespace

std::filesystem::path build_context_deps_dir_from_out_dir(
    std::filesystem::path const &out_dir) {
  std::filesystem::path dir{ std::filesystem::absolute(out_dir).lexically_normal() };
  if (!dir.has_filename() && dir.has_parent_path()) { dir = dir.parent_path(); }

  for (int i{ 0 }; i < kOutDirDepth; ++i) {
    auto parent{ dir.parent_path() };
    if (parent.empty() || parent == dir) {
      throw hijack_error(error_kind::invalid_build_context,
                         "Could not find deps from using '" + out_dir.string() + "'");
    }
    dir = std::move(parent);
  }

  return dir / "deps";
}

build_context build_context_from_env(build_context_overrides const &overrides) {
  build_context ctx{
    .target_triple = require_value(overrides.target_triple, "TARGET"),
    .profile = require_value(overrides.profile, "PROFILE"),
    .compiler_version =
        overrides.compiler_version
            ? *overrides.compiler_version
            : platform::env_var_get(kCompilerVersionEnvVar).value_or(""),
    .project_root = overrides.project_root
                        ? *overrides.project_root
                        : std::filesystem::path{ require_value(std::nullopt,
                                                               "CARGO_MANIFEST_DIR") },
    .deps_dir = resolve_deps_dir(overrides),
  };

  ctx.project_root = std::filesystem::absolute(ctx.project_root).lexically_normal();
  ctx.deps_dir = std::filesystem::absolute(ctx.deps_dir).lexically_normal();

  tui::debug("build context: target=%s profile=%s compiler=%s root=%s deps=%s",
             ctx.target_triple.c_str(),
             ctx.profile.c_str(),
             ctx.compiler_version.empty() ? "<unset>" : ctx.compiler_version.c_str(),
             ctx.project_root.string().c_str(),
             ctx.deps_dir.string().c_str());

  return ctx;
}

}  // namespace hijack
