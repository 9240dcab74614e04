#include "hijack_config.h"

#include "hijack_error.h"

#include <string>

namespace hijack {

std::string_view placement_name(placement_strategy placement) {
  switch (placement) {
    case placement_strategy::copy: return "copy";
    case placement_strategy::hard_link: return "hard";
    case placement_strategy::symbolic_link: return "symbolic";
  }
  return "unknown";
}

placement_strategy placement_parse(std::string_view value) {
  if (value == "copy") { return placement_strategy::copy; }
  if (value == "hard" || value == "hard-link") { return placement_strategy::hard_link; }
  if (value == "symbolic" || value == "symbolic-link" || value == "symlink") {
    return placement_strategy::symbolic_link;
  }

  throw hijack_error(error_kind::invalid_placement,
                     "Unknown link strategy '" + std::string{ value } +
                         "' (expected copy, hard or symbolic)");
}

}  // namespace hijack
