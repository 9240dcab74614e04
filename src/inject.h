#pragma once

#include "hijack_config.h"
#include "hijack_error.h"

#include <filesystem>
#include <system_error>

namespace hijack {

// Replaces `target` with `source` using `placement`. The replacement is staged at a
// hidden sibling of `target` and renamed into place, so readers see either the old or
// the new file. Injecting a path onto itself does nothing.
// Throws hijack_error (cross_device_link, filesystem_error).
void inject(std::filesystem::path const &source,
            std::filesystem::path const &target,
            placement_strategy placement);

// Error for a failed hard link of `source` at `staged`: EXDEV is cross_device_link,
// anything else filesystem_error.
hijack_error inject_hard_link_error(std::error_code const &ec,
                                    std::filesystem::path const &source,
                                    std::filesystem::path const &staged);

}  // namespace hijack
