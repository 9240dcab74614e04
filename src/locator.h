#pragma once

#include "hijack_config.h"
#include "template.h"
#include "uri.h"

#include <filesystem>
#include <string>

namespace hijack {

enum class locator_scheme { file, http, https };

std::string_view locator_scheme_name(locator_scheme scheme);

struct resolved_locator {
  locator_scheme scheme;
  std::string location;  // absolute path for file, URL otherwise
};

// Renders the package's source template, classifies it and checks the placement is
// usable with that scheme. Relative file paths anchor at `project_root`.
// Throws hijack_error (configuration category).
resolved_locator locator_resolve(std::string_view package_name,
                                 package_spec const &spec,
                                 template_context const &ctx,
                                 std::filesystem::path const &project_root);

}  // namespace hijack
