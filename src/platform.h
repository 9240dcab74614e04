#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace hijack::platform {

// rename(2): atomically replaces `to` when both paths share a filesystem.
void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

// link(2). Reports failure through `ec` so callers can tell EXDEV apart.
void hard_link(std::filesystem::path const &existing,
               std::filesystem::path const &link,
               std::error_code &ec);

bool is_cross_device(std::error_code const &ec);

std::optional<std::string> env_var_get(char const *name);
void env_var_set(char const *name, char const *value);
void env_var_unset(char const *name);

}  // namespace hijack::platform
