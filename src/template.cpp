#include "template.h"

#include "hijack_error.h"
#include "platform.h"
#include "util.h"

#include <cctype>
#include <string>

namespace hijack {
namespace {

constexpr std::string_view kOpen{ "{{" };
constexpr std::string_view kClose{ "}}" };

std::string_view trim(std::string_view value) {
  auto const first{ value.find_first_not_of(" \t") };
  if (first == std::string_view::npos) { return {}; }

  auto const last{ value.find_last_not_of(" \t") };
  return value.substr(first, last - first + 1);
}

bool is_valid_name(std::string_view name) {
  if (name.empty()) { return false; }

  auto const head{ static_cast<unsigned char>(name.front()) };
  if (!std::isalpha(head) && head != '_') { return false; }

  for (char const c : name.substr(1)) {
    auto const uc{ static_cast<unsigned char>(c) };
    if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') { return false; }
  }
  return true;
}

[[noreturn]] void throw_malformed(std::string_view tmpl,
                                  std::size_t offset,
                                  std::string_view what) {
  throw hijack_error(error_kind::malformed_template,
                     std::string{ what } + " at offset " + std::to_string(offset) +
                         " in template '" + std::string{ tmpl } + "'");
}

}  // namespace

bool operator==(substitution_value const &lhs, substitution_value const &rhs) {
  return lhs.value == rhs.value;
}

bool operator==(substitution_env const &lhs, substitution_env const &rhs) {
  return lhs.variable == rhs.variable;
}

template_context::template_context(build_context const &ctx,
                                   substitution_map const &user,
                                   std::optional<std::string> const &package_version) {
  variables_.insert_or_assign(std::string{ kTemplateVarTarget },
                              substitution_value{ ctx.target_triple });
  variables_.insert_or_assign(std::string{ kTemplateVarProfile },
                              substitution_value{ ctx.profile });
  // An unknown compiler version stays unresolved so referencing it fails.
  substitution compiler{ substitution_env{ std::string{ kCompilerVersionEnvVar } } };
  if (!ctx.compiler_version.empty()) {
    compiler = substitution_value{ ctx.compiler_version };
  }
  variables_.insert_or_assign(std::string{ kTemplateVarCompilerVersion }, compiler);
  variables_.insert_or_assign(std::string{ kTemplateVarRustcShortVersion }, compiler);

  if (package_version) {
    variables_.insert_or_assign(std::string{ kTemplateVarVersion },
                                substitution_value{ *package_version });
  }

  for (auto const &[name, sub] : user) { variables_.insert_or_assign(name, sub); }
}

std::string template_context::lookup(std::string_view name) const {
  auto const it{ variables_.find(name) };
  if (it == variables_.end()) {
    throw hijack_error(error_kind::unknown_variable,
                       "Unknown template variable '" + std::string{ name } + "'");
  }

  return std::visit(
      match{
          [](substitution_value const &v) -> std::string { return v.value; },
          [&](substitution_env const &e) -> std::string {
            if (auto value{ platform::env_var_get(e.variable.c_str()) }) { return *value; }
            throw hijack_error(error_kind::missing_environment_variable,
                               "Template variable '" + std::string{ name } +
                                   "' refers to unset environment variable '" +
                                   e.variable + "'");
          },
      },
      it->second);
}

std::string template_render(std::string_view tmpl, template_context const &ctx) {
  std::string result;
  result.reserve(tmpl.size());

  std::size_t pos{ 0 };
  while (pos < tmpl.size()) {
    auto const open{ tmpl.find(kOpen, pos) };
    auto const stray_close{ tmpl.find(kClose, pos) };

    if (stray_close != std::string_view::npos &&
        (open == std::string_view::npos || stray_close < open)) {
      throw_malformed(tmpl, stray_close, "Unbalanced '}}'");
    }

    if (open == std::string_view::npos) {
      result.append(tmpl.substr(pos));
      break;
    }

    result.append(tmpl.substr(pos, open - pos));

    auto const close{ tmpl.find(kClose, open + kOpen.size()) };
    if (close == std::string_view::npos) { throw_malformed(tmpl, open, "Unterminated '{{'"); }

    auto const name{ trim(tmpl.substr(open + kOpen.size(), close - open - kOpen.size())) };
    if (!is_valid_name(name)) {
      throw_malformed(tmpl,
                      open,
                      "Invalid placeholder '" +
                          std::string{ tmpl.substr(open, close + kClose.size() - open) } +
                          "'");
    }

    result.append(ctx.lookup(name));
    pos = close + kClose.size();
  }

  return result;
}

}  // namespace hijack
