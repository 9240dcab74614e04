#pragma once

#include "hijack_error.h"

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace hijack {

using sol_state_ptr = std::unique_ptr<sol::state>;

// base, string, os, math and table only; manifests have no io or package access.
sol_state_ptr sol_util_make_lua_state();

// Lua type name of `obj` ("nil", "string", "table", ...), for error messages.
std::string sol_util_type_name(sol::object const &obj);

namespace detail {

template <typename T>
constexpr std::string_view expected_type_name() {
  if constexpr (std::is_same_v<T, bool>) {
    return "boolean";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return "string";
  } else if constexpr (std::is_same_v<T, sol::table>) {
    return "table";
  } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
    return "number";
  } else {
    return "value";
  }
}

[[noreturn]] void sol_util_throw(std::string_view context, std::string_view key, std::string_view problem);

inline bool is_absent(sol::optional<sol::object> const &obj) {
  return !obj || !obj->valid() || obj->get_type() == sol::type::lua_nil;
}

}  // namespace detail

// Getters throw hijack_error(invalid_manifest) as "<context>: <key> <problem>".
template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::optional<sol::object> obj = table[key];
  if (detail::is_absent(obj)) { return std::nullopt; }
  if (!obj->is<T>()) {
    detail::sol_util_throw(context,
                           key,
                           "must be a " + std::string(detail::expected_type_name<T>()) +
                               ", got " + sol_util_type_name(*obj));
  }
  return obj->as<T>();
}

template <typename T>
T sol_util_get_required(sol::table const &table,
                        std::string_view key,
                        std::string_view context) {
  if (auto value{ sol_util_get_optional<T>(table, key, context) }) { return *value; }
  detail::sol_util_throw(context, key, "is required");
}

template <typename T>
T sol_util_get_or_default(sol::table const &table,
                          std::string_view key,
                          T const &default_value,
                          std::string_view context) {
  return sol_util_get_optional<T>(table, key, context).value_or(default_value);
}

// Calls fn(std::string key, sol::object value) for each entry; non-string keys throw.
template <typename Fn>
void sol_util_for_each_named(sol::table const &table, std::string_view context, Fn &&fn) {
  for (auto const &[key, value] : table) {
    if (key.get_type() != sol::type::string) {
      detail::sol_util_throw(context,
                             "keys",
                             "must be strings, got " + sol_util_type_name(key));
    }
    fn(key.as<std::string>(), value);
  }
}

}  // namespace hijack
