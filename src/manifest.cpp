#include "manifest.h"

#include "hijack_error.h"
#include "sol_util.h"
#include "tui.h"

#include <cstring>
#include <stdexcept>
#include <utility>
#include <string>

namespace hijack {

namespace {

[[noreturn]] void throw_invalid(std::filesystem::path const &manifest_path,
                                std::string const &message) {
  throw hijack_error(error_kind::invalid_manifest,
                     manifest_path.string() + ": " + message);
}

package_spec parse_package(std::string const &name,
                           sol::object const &value,
                           std::filesystem::path const &manifest_path) {
  std::string const context{ manifest_path.string() + ": PACKAGES." + name };

  // Names become staging directory components.
  if (name.empty() || name == "." || name == ".." ||
      name.find_first_of("/\\") != std::string::npos) {
    throw hijack_error(error_kind::invalid_manifest,
                       context + ": package name must be a plain file name");
  }

  if (value.get_type() == sol::type::string) {
    return package_spec{ .source = value.as<std::string>() };
  }

  if (value.get_type() != sol::type::table) {
    throw hijack_error(error_kind::invalid_manifest,
                       context + " must be a string or table, got " +
                           sol_util_type_name(value));
  }

  sol::table const table{ value.as<sol::table>() };
  package_spec spec;
  spec.source = sol_util_get_required<std::string>(table, "source", context);
  if (auto const link{ sol_util_get_optional<std::string>(table, "link", context) }) {
    spec.placement = placement_parse(*link);
  }
  spec.version = sol_util_get_optional<std::string>(table, "version", context);
  spec.export_name = sol_util_get_or_default<std::string>(table,
                                                          "export",
                                                          std::string{ kDefaultExportName },
                                                          context);

  if (spec.export_name.empty()) {
    throw hijack_error(error_kind::invalid_manifest, context + ": export is empty");
  }
  return spec;
}

substitution parse_substitution(std::string const &name,
                                sol::object const &value,
                                std::filesystem::path const &manifest_path) {
  std::string const context{ manifest_path.string() + ": SUBSTITUTIONS." + name };

  if (value.get_type() == sol::type::string) {
    return substitution_value{ value.as<std::string>() };
  }

  if (value.get_type() != sol::type::table) {
    throw hijack_error(error_kind::invalid_manifest,
                       context + " must be a string or table, got " +
                           sol_util_type_name(value));
  }

  sol::table const table{ value.as<sol::table>() };
  auto literal{ sol_util_get_optional<std::string>(table, "value", context) };
  auto env{ sol_util_get_optional<std::string>(table, "env", context) };
  if (literal && env) {
    throw hijack_error(error_kind::invalid_manifest,
                       context + ": 'value' and 'env' are mutually exclusive");
  }
  if (literal) { return substitution_value{ std::move(*literal) }; }
  if (env) { return substitution_env{ std::move(*env) }; }

  throw hijack_error(error_kind::invalid_manifest, context + ": expected 'value' or 'env'");
}

}  // namespace

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path,
    std::filesystem::path const &project_root) {
  auto const path{ std::filesystem::absolute(explicit_path ? *explicit_path
                                                           : project_root / kManifestFileName)
                       .lexically_normal() };
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw hijack_error(error_kind::invalid_manifest, "manifest not found: " + path.string());
  }
  return path;
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  std::vector<unsigned char> content;
  try {
    content = util_load_file(manifest_path);
  } catch (std::runtime_error const &e) {
    throw hijack_error(error_kind::invalid_manifest, e.what());
  }
  return load(content, manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::vector<unsigned char> const &content,
                                         std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest (%zu bytes)", content.size());
  std::string const script{ reinterpret_cast<char const *>(content.data()),
                            content.size() };

  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, manifest_path.string()) };
      !result.valid()) {
    sol::error err = result;
    throw_invalid(manifest_path,
                  std::string("Failed to execute manifest script: ") + err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;

  sol::object packages_obj = (*state)["PACKAGES"];
  if (!packages_obj.valid() || packages_obj.get_type() != sol::type::table) {
    throw_invalid(manifest_path, "Manifest must define 'PACKAGES' global as a table");
  }

  sol_util_for_each_named(packages_obj.as<sol::table>(),
                          manifest_path.string() + ": PACKAGES",
                          [&](std::string name, sol::object const &value) {
                            package_spec spec;
                            try {
                              spec = parse_package(name, value, manifest_path);
                            } catch (hijack_error const &e) {
                              tui::debug("%s", e.what());
                              spec.failure = package_failure{ .kind = e.kind(),
                                                              .message = e.what() };
                            }
                            m->config.packages.emplace(std::move(name), std::move(spec));
                          });

  sol::object subs_obj = (*state)["SUBSTITUTIONS"];
  if (subs_obj.valid() && subs_obj.get_type() != sol::type::lua_nil) {
    if (subs_obj.get_type() != sol::type::table) {
      throw_invalid(manifest_path, "'SUBSTITUTIONS' must be a table");
    }
    sol_util_for_each_named(subs_obj.as<sol::table>(),
                            manifest_path.string() + ": SUBSTITUTIONS",
                            [&](std::string name, sol::object const &value) {
                              auto sub{ parse_substitution(name, value, manifest_path) };
                              m->config.substitutions.insert_or_assign(std::move(name),
                                                                       std::move(sub));
                            });
  }

  tui::debug("Manifest declares %zu package(s), %zu substitution(s)",
             m->config.packages.size(),
             m->config.substitutions.size());
  return m;
}

std::unique_ptr<manifest> manifest::load(char const *script,
                                         std::filesystem::path const &manifest_path) {
  return load(std::vector<unsigned char>(script, script + std::strlen(script)),
              manifest_path);
}

}  // namespace hijack
