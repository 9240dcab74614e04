#pragma once

#include "build_context.h"
#include "hijack_config.h"
#include "hijack_error.h"
#include "locator.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hijack {

// Where one package would come from and what it would replace. Produced without
// touching the network or writing anything.
struct package_plan {
  std::string name;
  package_spec spec;
  std::optional<resolved_locator> locator;
  std::filesystem::path target;
  std::optional<package_failure> failure;
};

struct package_outcome {
  std::string name;
  std::vector<std::filesystem::path> injected;  // primary first, then auxiliaries
  std::optional<package_failure> failure;

  bool ok() const { return !failure.has_value(); }
};

struct delivery_report {
  std::vector<package_outcome> outcomes;  // sorted by package name

  bool ok() const;
  std::size_t failed_count() const;
  std::string summary() const;
};

struct deliver_options {
  // Print cargo:rerun-if-changed / cargo:warning directives on stdout.
  bool emit_directives{ true };
  // Parent of the per-run staging directory; the system temp dir when empty.
  std::filesystem::path staging_parent{};
};

std::vector<package_plan> engine_plan(hijack_config const &config,
                                      build_context const &ctx,
                                      deliver_options const &options = {});

delivery_report deliver(hijack_config const &config,
                        build_context const &ctx,
                        deliver_options const &options = {});

// Throws hijack_error(delivery_failed) carrying the report summary if any package failed.
delivery_report deliver_or_throw(hijack_config const &config,
                                 build_context const &ctx,
                                 deliver_options const &options = {});

}  // namespace hijack
