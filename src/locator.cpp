#include "locator.h"

#include "hijack_error.h"
#include "tui.h"

#include <string>

namespace hijack {

std::string_view locator_scheme_name(locator_scheme scheme) {
  switch (scheme) {
    case locator_scheme::file: return "file";
    case locator_scheme::http: return "http";
    case locator_scheme::https: return "https";
  }
  return "unknown";
}

resolved_locator locator_resolve(std::string_view package_name,
                                 package_spec const &spec,
                                 template_context const &ctx,
                                 std::filesystem::path const &project_root) {
  std::string const rendered{ template_render(spec.source, ctx) };
  auto const info{ uri_classify(rendered) };

  if (!uri_is_local(info.scheme) && !uri_is_remote(info.scheme)) {
    throw hijack_error(error_kind::unsupported_scheme,
                       "Package '" + std::string{ package_name } +
                           "' has unsupported source '" + rendered +
                           "' (expected file, http or https)");
  }

  resolved_locator result{};
  if (uri_is_remote(info.scheme)) {
    result = { info.scheme == uri_scheme::HTTPS ? locator_scheme::https : locator_scheme::http,
               info.canonical };
  } else {
    result = { locator_scheme::file, uri_local_path(info, project_root).string() };
  }

  if (result.scheme != locator_scheme::file && spec.placement != placement_strategy::copy) {
    throw hijack_error(error_kind::invalid_placement,
                       "Package '" + std::string{ package_name } + "' uses link = \"" +
                           std::string{ placement_name(spec.placement) } +
                           "\" with remote source '" + result.location +
                           "'; links are only supported for local files");
  }

  tui::debug("%.*s: %s -> %s",
             static_cast<int>(package_name.size()),
             package_name.data(),
             spec.source.c_str(),
             result.location.c_str());

  return result;
}

}  // namespace hijack
