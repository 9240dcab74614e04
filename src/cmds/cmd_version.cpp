#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "archive.h"
#include "curl/curl.h"
#include "sol/sol.hpp"
#include "tbb/version.h"

#ifndef HIJACK_VERSION_STR
#error "HIJACK_VERSION_STR must be defined by the build system"
#endif

namespace hijack {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, cli_globals const & /*globals*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("hijack version %s", HIJACK_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");

  curl_version_info_data const *curl_info{ curl_version_info(CURLVERSION_NOW) };
  tui::info("  libcurl: %s (%s)",
            curl_info->version,
            curl_info->ssl_version ? curl_info->ssl_version : "no TLS");
  tui::info("  libarchive: %s", archive_version_details());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace hijack
