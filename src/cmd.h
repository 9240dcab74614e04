#pragma once

#include "build_context.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace hijack {

// Options given before the subcommand; every command sees the same set.
struct cli_globals {
  build_context_overrides context;
  std::optional<std::filesystem::path> manifest_path;
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual bool execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cli_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cli_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace hijack
