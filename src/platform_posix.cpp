#include "platform.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace hijack::platform {

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void hard_link(std::filesystem::path const &existing,
               std::filesystem::path const &link,
               std::error_code &ec) {
  ec.clear();
  if (::link(existing.c_str(), link.c_str()) != 0) {
    ec = std::error_code{ errno, std::system_category() };
  }
}

bool is_cross_device(std::error_code const &ec) {
  return ec == std::errc::cross_device_link;
}

std::optional<std::string> env_var_get(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_get: null name"); }
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

void env_var_set(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("env_var_set: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("env_var_set: failed to set ") + name);
  }
}

void env_var_unset(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("env_var_unset: null name"); }
  ::unsetenv(name);
}

}  // namespace hijack::platform
