#include "hijack_error.h"

namespace hijack {

hijack_error::hijack_error(error_kind kind, std::string const &message)
    : std::runtime_error{ message }, kind_{ kind } {}

error_category error_kind_category(error_kind kind) {
  switch (kind) {
    case error_kind::unknown_variable:
    case error_kind::malformed_template:
    case error_kind::missing_environment_variable:
    case error_kind::unsupported_scheme:
    case error_kind::invalid_placement:
    case error_kind::invalid_manifest:
    case error_kind::invalid_build_context: return error_category::configuration;

    case error_kind::not_found:
    case error_kind::transport_error:
    case error_kind::unexpected_status: return error_category::fetch;

    case error_kind::corrupt_archive:
    case error_kind::missing_primary_artifact:
    case error_kind::ambiguous_primary_artifact: return error_category::archive;

    case error_kind::dummy_artifact_not_found: return error_category::precondition;

    case error_kind::cross_device_link:
    case error_kind::filesystem_error: return error_category::injection;

    case error_kind::delivery_failed: return error_category::delivery;
  }
  return error_category::delivery;
}

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::unknown_variable: return "unknown_variable";
    case error_kind::malformed_template: return "malformed_template";
    case error_kind::missing_environment_variable: return "missing_environment_variable";
    case error_kind::unsupported_scheme: return "unsupported_scheme";
    case error_kind::invalid_placement: return "invalid_placement";
    case error_kind::invalid_manifest: return "invalid_manifest";
    case error_kind::invalid_build_context: return "invalid_build_context";
    case error_kind::not_found: return "not_found";
    case error_kind::transport_error: return "transport_error";
    case error_kind::unexpected_status: return "unexpected_status";
    case error_kind::corrupt_archive: return "corrupt_archive";
    case error_kind::missing_primary_artifact: return "missing_primary_artifact";
    case error_kind::ambiguous_primary_artifact: return "ambiguous_primary_artifact";
    case error_kind::dummy_artifact_not_found: return "dummy_artifact_not_found";
    case error_kind::cross_device_link: return "cross_device_link";
    case error_kind::filesystem_error: return "filesystem_error";
    case error_kind::delivery_failed: return "delivery_failed";
  }
  return "unknown";
}

std::string_view error_category_name(error_category category) {
  switch (category) {
    case error_category::configuration: return "configuration";
    case error_category::fetch: return "fetch";
    case error_category::archive: return "archive";
    case error_category::precondition: return "precondition";
    case error_category::injection: return "injection";
    case error_category::delivery: return "delivery";
  }
  return "unknown";
}

}  // namespace hijack
