#include "template.h"

#include "hijack_error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <string>

namespace {

hijack::build_context make_ctx() {
  return hijack::build_context{ .target_triple = "x86_64-unknown-linux-gnu",
                                .profile = "release",
                                .compiler_version = "1.70.0",
                                .project_root = "/work/proj",
                                .deps_dir = "/work/proj/target/release/deps" };
}

}  // namespace

TEST_CASE("template_render expands built-in variables") {
  hijack::template_context const ctx{ make_ctx(), {} };
  CHECK(hijack::template_render("https://x/{{target}}/{{ profile }}/lib.tgz", ctx) ==
        "https://x/x86_64-unknown-linux-gnu/release/lib.tgz");
  CHECK(hijack::template_render("{{compiler_version}}", ctx) == "1.70.0");
  CHECK(hijack::template_render("{{rustc_short_version}}", ctx) == "1.70.0");
}

TEST_CASE("unknown compiler version is reported, not rendered empty") {
  auto build{ make_ctx() };
  build.compiler_version.clear();

  SUBCASE("unset environment fails when referenced") {
    hijack::test::scoped_env const env{ hijack::kCompilerVersionEnvVar, std::nullopt };
    hijack::template_context const ctx{ build, {} };
    CHECK(hijack::template_render("https://h/{{target}}/lib.rlib", ctx) ==
          "https://h/x86_64-unknown-linux-gnu/lib.rlib");
    CHECK(hijack::test::error_kind_of([&] {
            hijack::template_render("https://h/{{compiler_version}}/{{target}}/lib.rlib", ctx);
          }) == hijack::error_kind::missing_environment_variable);
    CHECK(hijack::test::error_kind_of([&] {
            hijack::template_render("{{rustc_short_version}}", ctx);
          }) == hijack::error_kind::missing_environment_variable);
  }

  SUBCASE("environment supplies it late") {
    hijack::test::scoped_env const env{ hijack::kCompilerVersionEnvVar, "1.81.0" };
    hijack::template_context const ctx{ build, {} };
    CHECK(hijack::template_render("{{rustc_short_version}}", ctx) == "1.81.0");
  }

  SUBCASE("user substitution fills it") {
    hijack::substitution_map user;
    user.emplace("compiler_version", hijack::substitution_value{ "nightly" });
    hijack::template_context const ctx{ build, user };
    CHECK(hijack::template_render("{{compiler_version}}", ctx) == "nightly");
  }
}

TEST_CASE("template_render leaves text without placeholders untouched") {
  hijack::template_context const ctx{ make_ctx(), {} };
  CHECK(hijack::template_render("", ctx).empty());
  CHECK(hijack::template_render("plain/path.rlib", ctx) == "plain/path.rlib");
  CHECK(hijack::template_render("a{b}c", ctx) == "a{b}c");
}

TEST_CASE("template_render is deterministic") {
  hijack::template_context const ctx{ make_ctx(), {} };
  auto const first{ hijack::template_render("{{target}}-{{profile}}", ctx) };
  CHECK(hijack::template_render("{{target}}-{{profile}}", ctx) == first);
}

TEST_CASE("template_render rejects unknown variables") {
  hijack::template_context const ctx{ make_ctx(), {} };
  CHECK(hijack::test::error_kind_of([&] { hijack::template_render("{{nope}}", ctx); }) ==
        hijack::error_kind::unknown_variable);
  // version only exists when the package declares one
  CHECK(hijack::test::error_kind_of([&] { hijack::template_render("{{version}}", ctx); }) ==
        hijack::error_kind::unknown_variable);
}

TEST_CASE("template_render rejects malformed placeholders") {
  hijack::template_context const ctx{ make_ctx(), {} };
  for (char const *bad : { "{{target", "target}}", "{{}}", "{{ 1abc }}", "{{a b}}" }) {
    CAPTURE(bad);
    CHECK(hijack::test::error_kind_of([&] { hijack::template_render(bad, ctx); }) ==
          hijack::error_kind::malformed_template);
  }
}

TEST_CASE("template_context layers package version and user substitutions") {
  hijack::substitution_map user;
  user.emplace("mirror", hijack::substitution_value{ "https://mirror" });

  SUBCASE("package version is visible") {
    hijack::template_context const ctx{ make_ctx(), user, std::string{ "0.4.2" } };
    CHECK(hijack::template_render("{{mirror}}/v{{version}}", ctx) == "https://mirror/v0.4.2");
  }

  SUBCASE("user entries replace built-ins and version") {
    user.insert_or_assign("profile", hijack::substitution_value{ "custom" });
    user.insert_or_assign("version", hijack::substitution_value{ "9.9" });
    hijack::template_context const ctx{ make_ctx(), user, std::string{ "0.4.2" } };
    CHECK(hijack::template_render("{{profile}}-{{version}}", ctx) == "custom-9.9");
  }
}

TEST_CASE("env substitutions are read when referenced") {
  hijack::substitution_map user;
  user.emplace("token", hijack::substitution_env{ "HIJACK_TEST_TEMPLATE_TOKEN" });

  SUBCASE("unset variable fails only when used") {
    hijack::test::scoped_env const env{ "HIJACK_TEST_TEMPLATE_TOKEN", std::nullopt };
    hijack::template_context const ctx{ make_ctx(), user };
    CHECK(hijack::template_render("{{target}}", ctx) == "x86_64-unknown-linux-gnu");
    CHECK(hijack::test::error_kind_of([&] { hijack::template_render("{{token}}", ctx); }) ==
          hijack::error_kind::missing_environment_variable);
  }

  SUBCASE("set variable is substituted") {
    hijack::test::scoped_env const env{ "HIJACK_TEST_TEMPLATE_TOKEN", "s3cr3t" };
    hijack::template_context const ctx{ make_ctx(), user };
    CHECK(hijack::template_render("https://h/{{ token }}", ctx) == "https://h/s3cr3t");
  }
}

TEST_CASE("template names allow dots and dashes") {
  hijack::substitution_map user;
  user.emplace("my.var-1", hijack::substitution_value{ "ok" });
  hijack::template_context const ctx{ make_ctx(), user };
  CHECK(hijack::template_render("{{my.var-1}}", ctx) == "ok");
}
