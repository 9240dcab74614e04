#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hijack {

enum class resource_kind { raw, archive };

std::string_view resource_kind_name(resource_kind kind);

// Sniffs the leading bytes of `path`: gzip, xz, bzip2, zstd or an uncompressed tar are
// archives, everything else (an ar-format .rlib included) is raw.
resource_kind extract_detect_kind(std::filesystem::path const &path);

struct auxiliary_artifact {
  std::string file_name;
  std::filesystem::path path;
};

struct archive_manifest {
  std::filesystem::path primary;
  std::vector<auxiliary_artifact> auxiliaries;  // archive order
};

struct raw_artifact {
  std::filesystem::path path;
};

using extract_result = std::variant<archive_manifest, raw_artifact>;

// Unpacks an archive's regular entries flat into `staging_dir`, splitting out the
// entry named `primary_name`. Raw resources pass through untouched.
// Throws hijack_error (archive category).
extract_result extract_artifacts(std::filesystem::path const &resource,
                                 resource_kind kind,
                                 std::filesystem::path const &staging_dir,
                                 std::string_view primary_name);

}  // namespace hijack
