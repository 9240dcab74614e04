#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace hijack {

enum class error_category { configuration, fetch, archive, precondition, injection, delivery };

enum class error_kind {
  // configuration
  unknown_variable,
  malformed_template,
  missing_environment_variable,
  unsupported_scheme,
  invalid_placement,
  invalid_manifest,
  invalid_build_context,
  // fetch
  not_found,
  transport_error,
  unexpected_status,
  // archive
  corrupt_archive,
  missing_primary_artifact,
  ambiguous_primary_artifact,
  // precondition
  dummy_artifact_not_found,
  // injection
  cross_device_link,
  filesystem_error,
  // delivery
  delivery_failed
};

error_category error_kind_category(error_kind kind);
std::string_view error_kind_name(error_kind kind);
std::string_view error_category_name(error_category category);

// Every failure raised by the core. The message is complete on its own; kind and
// category exist so callers and tests can branch without parsing text.
class hijack_error : public std::runtime_error {
 public:
  hijack_error(error_kind kind, std::string const &message);

  error_kind kind() const noexcept { return kind_; }
  error_category category() const noexcept { return error_kind_category(kind_); }

 private:
  error_kind kind_;
};

}  // namespace hijack
