#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace hijack {

// Index of the dummy artifacts the build orchestrator left in its deps directory,
// keyed by crate name (`lib<crate>-<fingerprint>.rlib`).
class output_locator {
 public:
  // Lists `deps_dir` once. A missing or unreadable directory is not an error here;
  // every later locate() reports it instead. When `emit_directives` is set, duplicate
  // entries produce a `cargo:warning=` line on stdout.
  static output_locator scan(std::filesystem::path const &deps_dir,
                             bool emit_directives = true);

  // Absolute path of the dummy artifact for `package` ('-' normalized to '_').
  // Throws hijack_error (dummy_artifact_not_found).
  std::filesystem::path locate(std::string_view package) const;

  std::filesystem::path auxiliary_target(std::string_view file_name) const;

  std::size_t size() const { return entries_.size(); }

  // Crate name for a deps directory file name, or nullopt if it is not an rlib.
  static std::optional<std::string> crate_name_of(std::string_view file_name);

 private:
  struct entry {
    std::string file_name;
    std::filesystem::file_time_type modified;
  };

  explicit output_locator(std::filesystem::path deps_dir);

  std::filesystem::path deps_dir_;
  std::optional<std::string> scan_error_;
  std::map<std::string, entry, std::less<>> entries_;
};

}  // namespace hijack
