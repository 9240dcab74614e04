#pragma once

#include "hijack_error.h"
#include "template.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hijack {

enum class placement_strategy { copy, hard_link, symbolic_link };

std::string_view placement_name(placement_strategy placement);

// Accepts "copy", "hard", "hard-link", "symbolic", "symbolic-link", "symlink".
// Throws hijack_error (invalid_placement) otherwise.
placement_strategy placement_parse(std::string_view value);

inline constexpr std::string_view kDefaultExportName{ "export.rlib" };

struct package_failure {
  error_kind kind;
  std::string message;
};

struct package_spec {
  std::string source;  // locator template, pre-substitution
  placement_strategy placement{ placement_strategy::copy };
  std::optional<std::string> version;
  std::string export_name{ kDefaultExportName };  // primary entry inside an archive
  // Set when the manifest entry could not be parsed; the package fails on its own.
  std::optional<package_failure> failure{};
};

// Typed configuration handed to the core. Keys are dependency names as the build graph
// knows them; iteration order (sorted by name) is the order packages are reported in.
struct hijack_config {
  std::map<std::string, package_spec> packages;
  substitution_map substitutions;
};

}  // namespace hijack
