#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace hijack {

inline constexpr char kCompilerVersionEnvVar[]{ "HIJACK_COMPILER_VERSION" };

// Values the build orchestrator supplies for one invocation. Passed explicitly to the
// template resolver and output locator; nothing in the core reads them ambiently.
struct build_context {
  std::string target_triple;
  std::string profile;
  std::string compiler_version;  // empty when unknown
  std::filesystem::path project_root;
  std::filesystem::path deps_dir;
};

struct build_context_overrides {
  std::optional<std::string> target_triple;
  std::optional<std::string> profile;
  std::optional<std::string> compiler_version;
  std::optional<std::filesystem::path> project_root;
  std::optional<std::filesystem::path> deps_dir;
  std::optional<std::filesystem::path> out_dir;
};

// Reads TARGET, PROFILE, HIJACK_COMPILER_VERSION, CARGO_MANIFEST_DIR and either
// HIJACK_DEPS_DIR or OUT_DIR. Overrides win over the environment. Throws hijack_error
// (invalid_build_context) naming the first missing value.
build_context build_context_from_env(build_context_overrides const &overrides = {});

// `<root>/build/<pkg>/out` -> `<root>/deps`
std::filesystem::path build_context_deps_dir_from_out_dir(
    std::filesystem::path const &out_dir);

}  // namespace hijack
