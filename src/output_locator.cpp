#include "output_locator.h"

#include "hijack_error.h"
#include "tui.h"

#include <algorithm>
#include <string>
#include <system_error>

namespace hijack {
namespace {

constexpr std::string_view kLibPrefix{ "lib" };
constexpr std::string_view kRlibSuffix{ ".rlib" };

std::string normalize_package_name(std::string_view package) {
  std::string name{ package };
  std::ranges::replace(name, '-', '_');
  return name;
}

// Valid UTF-8 check; non-UTF-8 names can never match a crate.
bool is_utf8(std::string_view s) {
  std::size_t i{ 0 };
  while (i < s.size()) {
    auto const c{ static_cast<unsigned char>(s[i]) };
    std::size_t len{ 0 };
    if (c < 0x80) {
      len = 1;
    } else if ((c & 0xe0) == 0xc0) {
      len = 2;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4;
    } else {
      return false;
    }
    if (i + len > s.size()) { return false; }
    for (std::size_t j{ 1 }; j < len; ++j) {
      if ((static_cast<unsigned char>(s[i + j]) & 0xc0) != 0x80) { return false; }
    }
    i += len;
  }
  return true;
}

}  // namespace

output_locator::output_locator(std::filesystem::path deps_dir)
    : deps_dir_{ std::move(deps_dir) } {}

std::optional<std::string> output_locator::crate_name_of(std::string_view file_name) {
  if (!is_utf8(file_name)) { return std::nullopt; }
  if (!file_name.starts_with(kLibPrefix) || !file_name.ends_with(kRlibSuffix)) {
    return std::nullopt;
  }

  auto const stem{ file_name.substr(kLibPrefix.size(),
                                    file_name.size() - kLibPrefix.size() -
                                        kRlibSuffix.size()) };
  auto const dash{ stem.find('-') };
  if (dash == std::string_view::npos || dash == 0) { return std::nullopt; }
  return std::string{ stem.substr(0, dash) };
}

output_locator output_locator::scan(std::filesystem::path const &deps_dir,
                                    bool emit_directives) {
  output_locator result{ deps_dir };

  std::error_code ec;
  std::filesystem::directory_iterator it{ deps_dir, ec };
  if (ec) {
    result.scan_error_ = "Cannot read deps directory " + deps_dir.string() + ": " +
                         ec.message();
    tui::debug("%s", result.scan_error_->c_str());
    return result;
  }

  for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      result.scan_error_ = "Failed while listing deps directory " + deps_dir.string() +
                           ": " + ec.message();
      result.entries_.clear();
      return result;
    }

    std::string const file_name{ it->path().filename().string() };
    auto crate{ crate_name_of(file_name) };
    if (!crate) { continue; }

    std::error_code time_ec;
    auto const modified{ it->last_write_time(time_ec) };
    if (time_ec) {
      tui::debug("Skipping %s: %s", file_name.c_str(), time_ec.message().c_str());
      continue;
    }

    entry candidate{ .file_name = file_name, .modified = modified };
    auto const [existing, inserted]{ result.entries_.try_emplace(*crate, candidate) };
    if (inserted) { continue; }

    std::string warning;
    if (existing->second.modified > candidate.modified) {
      warning = "duplicate entry for " + *crate + ": '" + candidate.file_name + "' ignored";
    } else {
      warning = "duplicate entry for " + *crate + ": '" + existing->second.file_name +
                "' replaced with '" + candidate.file_name + "'";
      existing->second = std::move(candidate);
    }

    tui::warn("%s", warning.c_str());
    if (emit_directives) { tui::print_stdout("cargo:warning=%s\n", warning.c_str()); }
  }

  tui::debug("output_locator: %zu artifact(s) in %s",
             result.entries_.size(),
             deps_dir.string().c_str());
  return result;
}

std::filesystem::path output_locator::locate(std::string_view package) const {
  if (scan_error_) {
    throw hijack_error(error_kind::dummy_artifact_not_found,
                       "No dummy artifact for '" + std::string{ package } +
                           "': " + *scan_error_);
  }

  auto const it{ entries_.find(normalize_package_name(package)) };
  if (it == entries_.end()) {
    throw hijack_error(error_kind::dummy_artifact_not_found,
                       "No dummy artifact for '" + std::string{ package } + "' in " +
                           deps_dir_.string());
  }
  return deps_dir_ / it->second.file_name;
}

std::filesystem::path output_locator::auxiliary_target(std::string_view file_name) const {
  return deps_dir_ / file_name;
}

}  // namespace hijack
