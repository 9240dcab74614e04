#pragma once

#include "hijack_config.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace hijack {

inline constexpr char kManifestFileName[]{ "hijack.lua" };

// hijack.lua, evaluated once and reduced to the typed configuration the core consumes.
// The Lua state does not outlive loading.
struct manifest : unmovable {
  hijack_config config;
  std::filesystem::path manifest_path;

  manifest() = default;

  // `explicit_path` if given, otherwise `<project_root>/hijack.lua`. Returns an absolute
  // path; throws hijack_error (invalid_manifest) if the file does not exist.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path,
      std::filesystem::path const &project_root);

  // All overloads throw hijack_error (invalid_manifest) for a manifest that cannot be
  // evaluated as a whole. A single bad PACKAGES entry is kept with its failure set.
  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::vector<unsigned char> const &content,
                                        std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(char const *script,
                                        std::filesystem::path const &manifest_path);
};

}  // namespace hijack
