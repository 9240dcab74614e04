#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hijack {

enum class uri_scheme { HTTP, HTTPS, LOCAL_FILE_ABSOLUTE, LOCAL_FILE_RELATIVE, UNKNOWN };

struct uri_info {
  uri_scheme scheme;
  std::string canonical;
};

uri_info uri_classify(std::string_view value);

bool uri_is_local(uri_scheme scheme);
bool uri_is_remote(uri_scheme scheme);

// Absolute, normalized path of a classified local uri; relative paths are anchored at
// `anchor` (the working directory when unset). Throws std::invalid_argument for a
// non-local scheme.
std::filesystem::path uri_local_path(uri_info const &info,
                                     std::optional<std::filesystem::path> const &anchor);

}  // namespace hijack
