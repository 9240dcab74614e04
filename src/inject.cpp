#include "inject.h"

#include "hijack_error.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <string>
#include <system_error>

namespace hijack {
namespace {

std::filesystem::path normalized_absolute(std::filesystem::path const &p) {
  return std::filesystem::absolute(p).lexically_normal();
}

[[noreturn]] void throw_fs(std::string const &what,
                           std::filesystem::path const &source,
                           std::filesystem::path const &target,
                           std::error_code const &ec) {
  throw hijack_error(error_kind::filesystem_error,
                     what + " " + source.string() + " -> " + target.string() + ": " +
                         ec.message());
}

void stage_copy(std::filesystem::path const &source, std::filesystem::path const &staged) {
  std::error_code ec;
  std::filesystem::copy_file(source, staged, ec);
  if (ec) { throw_fs("Failed to copy", source, staged, ec); }
}

void stage_hard_link(std::filesystem::path const &source,
                     std::filesystem::path const &staged) {
  std::error_code ec;
  platform::hard_link(source, staged, ec);
  if (ec) { throw inject_hard_link_error(ec, source, staged); }
}

void stage_symbolic_link(std::filesystem::path const &source,
                         std::filesystem::path const &staged) {
  std::error_code ec;
  std::filesystem::create_symlink(source, staged, ec);
  if (ec) { throw_fs("Failed to create symlink", source, staged, ec); }
}

}  // namespace

hijack_error inject_hard_link_error(std::error_code const &ec,
                                    std::filesystem::path const &source,
                                    std::filesystem::path const &staged) {
  if (platform::is_cross_device(ec)) {
    return hijack_error(error_kind::cross_device_link,
                        "Cannot hard link across filesystems: " + source.string() + " -> " +
                            staged.parent_path().string());
  }
  return hijack_error(error_kind::filesystem_error,
                      "Failed to hard link " + source.string() + " -> " + staged.string() +
                          ": " + ec.message());
}

void inject(std::filesystem::path const &source,
            std::filesystem::path const &target,
            placement_strategy placement) {
  auto const abs_source{ normalized_absolute(source) };
  auto const abs_target{ normalized_absolute(target) };

  if (abs_source == abs_target) {
    tui::debug("inject: %s is already in place", abs_target.string().c_str());
    return;
  }

  auto const parent{ abs_target.parent_path() };
  std::error_code ec;
  if (!std::filesystem::is_directory(parent, ec)) {
    throw hijack_error(error_kind::filesystem_error,
                       "Target directory does not exist: " + parent.string());
  }

  auto const staged{ util_unique_path(
      parent,
      "." + abs_target.filename().string() + ".hijack-") };
  scoped_path_cleanup staged_cleanup{ staged };

  switch (placement) {
    case placement_strategy::copy: stage_copy(abs_source, staged); break;
    case placement_strategy::hard_link: stage_hard_link(abs_source, staged); break;
    case placement_strategy::symbolic_link: stage_symbolic_link(abs_source, staged); break;
  }

  try {
    platform::atomic_rename(staged, abs_target);
  } catch (std::system_error const &e) {
    throw hijack_error(error_kind::filesystem_error,
                       "Failed to replace " + abs_target.string() + ": " + e.what());
  }

  tui::debug("inject: %s -> %s (%.*s)",
             abs_source.string().c_str(),
             abs_target.string().c_str(),
             static_cast<int>(placement_name(placement).size()),
             placement_name(placement).data());
}

}  // namespace hijack
