#include "uri.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hijack {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

std::string_view trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t\n\r\f\v") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t\n\r\f\v") };
  return value.substr(first, last - first + 1);
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

// file:///abs/path -> /abs/path, file://localhost/abs -> /abs, file://rel/path ->
// rel/path (resolved later against the project root).
std::string strip_file_scheme(std::string_view uri) {
  std::string_view cand{ uri.substr(7) };
  if (istarts_with(cand, "localhost/")) { cand.remove_prefix(9); }
  return std::string{ cand };
}

std::filesystem::path base_directory(std::optional<std::filesystem::path> const &root) {
  if (root && !root->empty()) { return std::filesystem::absolute(*root); }
  return std::filesystem::current_path();
}

}  // namespace

uri_info uri_classify(std::string_view value) {
  auto canonical{ std::string{ trim(value) } };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) }; }

  if (istarts_with(canonical, "https://")) {
    return uri_info{ uri_scheme::HTTPS, std::move(canonical) };
  }
  if (istarts_with(canonical, "http://")) {
    return uri_info{ uri_scheme::HTTP, std::move(canonical) };
  }

  std::string const local_source{ istarts_with(canonical, "file://")
                                      ? strip_file_scheme(canonical)
                                      : canonical };

  // file:// wrapping another scheme (file://http://...) is not a path either.
  if (local_source.empty() || local_source.find("://") != std::string::npos) {
    return uri_info{ uri_scheme::UNKNOWN, std::move(canonical) };
  }

  auto const scheme{ std::filesystem::path{ local_source }.is_absolute()
                         ? uri_scheme::LOCAL_FILE_ABSOLUTE
                         : uri_scheme::LOCAL_FILE_RELATIVE };
  return uri_info{ scheme, local_source };
}

bool uri_is_local(uri_scheme scheme) {
  return scheme == uri_scheme::LOCAL_FILE_ABSOLUTE ||
         scheme == uri_scheme::LOCAL_FILE_RELATIVE;
}

bool uri_is_remote(uri_scheme scheme) {
  return scheme == uri_scheme::HTTP || scheme == uri_scheme::HTTPS;
}

std::filesystem::path uri_local_path(uri_info const &info,
                                     std::optional<std::filesystem::path> const &anchor) {
  if (!uri_is_local(info.scheme)) {
    throw std::invalid_argument("uri_local_path: '" + info.canonical + "' is not a local file");
  }

  std::filesystem::path resolved{ info.canonical };
  if (info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    resolved = std::filesystem::absolute(base_directory(anchor) / resolved);
  }

  return resolved.lexically_normal();
}

}  // namespace hijack
