#pragma once

#include "build_context.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hijack {

struct substitution_value {
  std::string value;
};

// Resolved from the named environment variable each time a template references it.
struct substitution_env {
  std::string variable;
};

using substitution = std::variant<substitution_value, substitution_env>;
using substitution_map = std::map<std::string, substitution, std::less<>>;

inline constexpr std::string_view kTemplateVarTarget{ "target" };
inline constexpr std::string_view kTemplateVarProfile{ "profile" };
inline constexpr std::string_view kTemplateVarCompilerVersion{ "compiler_version" };
inline constexpr std::string_view kTemplateVarRustcShortVersion{ "rustc_short_version" };
inline constexpr std::string_view kTemplateVarVersion{ "version" };

bool operator==(substitution_value const &lhs, substitution_value const &rhs);
bool operator==(substitution_env const &lhs, substitution_env const &rhs);

// Variable set for one package's locator. Layering, lowest to highest precedence:
// built-ins from the build context, the package version, user substitutions. A higher
// layer replaces a lower one wholesale.
class template_context {
 public:
  template_context(build_context const &ctx,
                   substitution_map const &user,
                   std::optional<std::string> const &package_version = std::nullopt);

  // Throws hijack_error: unknown_variable, missing_environment_variable.
  std::string lookup(std::string_view name) const;

  substitution_map const &variables() const { return variables_; }

 private:
  substitution_map variables_;
};

// Expands `{{ name }}` placeholders. Throws hijack_error: malformed_template,
// unknown_variable, missing_environment_variable.
std::string template_render(std::string_view tmpl, template_context const &ctx);

}  // namespace hijack
