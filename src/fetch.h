#pragma once

#include "extract.h"
#include "locator.h"

#include <filesystem>

namespace hijack {

struct fetched_resource {
  std::filesystem::path path;
  bool is_original_source{ false };  // true: `path` is the user's own file, not a staged copy
  resource_kind kind{ resource_kind::raw };
};

// Makes the resource named by `locator` available on the local filesystem. Local files
// are used in place; http(s) downloads land in `staging_dir`.
// Throws hijack_error (fetch category).
fetched_resource fetch(resolved_locator const &locator,
                       std::filesystem::path const &staging_dir);

}  // namespace hijack
