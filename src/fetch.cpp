#include "fetch.h"

#include "hijack_error.h"
#include "libcurl_util.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace hijack {
namespace {

constexpr char kPartialDownloadName[]{ "download.part" };
constexpr char kDownloadName[]{ "download" };

fetched_resource fetch_local_file(std::filesystem::path const &source) {
  std::error_code ec;
  auto const status{ std::filesystem::status(source, ec) };
  if (ec || !std::filesystem::exists(status)) {
    throw hijack_error(error_kind::not_found,
                       "Source file does not exist: " + source.string());
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw hijack_error(error_kind::not_found,
                       "Source is not a regular file: " + source.string());
  }

  return fetched_resource{ .path = source,
                           .is_original_source = true,
                           .kind = extract_detect_kind(source) };
}

fetched_resource fetch_remote(std::string const &url,
                              std::filesystem::path const &staging_dir) {
  std::error_code ec;
  std::filesystem::create_directories(staging_dir, ec);
  if (ec) {
    throw hijack_error(error_kind::filesystem_error,
                       "Failed to create staging directory " + staging_dir.string() +
                           ": " + ec.message());
  }

  auto const partial{ staging_dir / kPartialDownloadName };
  auto const complete{ staging_dir / kDownloadName };

  auto const result{ libcurl_download(url, partial) };

  try {
    platform::atomic_rename(partial, complete);
  } catch (std::system_error const &e) {
    std::filesystem::remove(partial, ec);
    throw hijack_error(error_kind::filesystem_error,
                       "Failed to finalize download " + complete.string() + ": " +
                           e.what());
  }

  tui::debug("fetch: %s -> %s (%s)",
             url.c_str(),
             complete.string().c_str(),
             util_format_bytes(result.bytes).c_str());

  return fetched_resource{ .path = complete,
                           .is_original_source = false,
                           .kind = extract_detect_kind(complete) };
}

}  // namespace

fetched_resource fetch(resolved_locator const &locator,
                       std::filesystem::path const &staging_dir) {
  auto const result{ locator.scheme == locator_scheme::file
                         ? fetch_local_file(locator.location)
                         : fetch_remote(locator.location, staging_dir) };

  auto const scheme{ locator_scheme_name(locator.scheme) };
  auto const kind{ resource_kind_name(result.kind) };
  tui::debug("fetch: %.*s resource %s is %.*s",
             static_cast<int>(scheme.size()),
             scheme.data(),
             result.path.string().c_str(),
             static_cast<int>(kind.size()),
             kind.data());
  return result;
}

}  // namespace hijack
