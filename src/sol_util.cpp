#include "sol_util.h"

namespace hijack {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table);
  return lua;
}

std::string sol_util_type_name(sol::object const &obj) {
  return sol::type_name(obj.lua_state(), obj.get_type());
}

namespace detail {

void sol_util_throw(std::string_view context, std::string_view key, std::string_view problem) {
  throw hijack_error(error_kind::invalid_manifest,
                     std::string(context) + ": " + std::string(key) + " " +
                         std::string(problem));
}

}  // namespace detail

}  // namespace hijack
