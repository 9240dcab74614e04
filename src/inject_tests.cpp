#include "inject.h"

#include "hijack_error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace {

bool has_staging_leftovers(std::filesystem::path const &dir) {
  for (auto const &entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".hijack-") != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST_CASE("inject copy replaces the target byte for byte") {
  hijack::test::temp_dir const tmp;
  auto const source{ tmp / "prebuilt.rlib" };
  auto const target{ tmp / "deps" / "libdemo-1.rlib" };
  hijack::test::write_file(source, std::string{ "real\0artifact", 13 });
  hijack::test::write_file(target, "dummy");

  hijack::inject(source, target, hijack::placement_strategy::copy);
  CHECK(hijack::test::read_file(target) == std::string{ "real\0artifact", 13 });
  CHECK_FALSE(std::filesystem::is_symlink(target));

  // idempotent
  hijack::inject(source, target, hijack::placement_strategy::copy);
  CHECK(hijack::test::read_file(target) == std::string{ "real\0artifact", 13 });
  CHECK_FALSE(has_staging_leftovers(tmp / "deps"));

  // later edits to the source do not reach a copy
  hijack::test::write_file(source, "changed");
  CHECK(hijack::test::read_file(target) == std::string{ "real\0artifact", 13 });
}

TEST_CASE("inject copy creates a missing target") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_file(tmp / "src.rlib", "aux");
  std::filesystem::create_directories(tmp / "deps");

  hijack::inject(tmp / "src.rlib", tmp / "deps" / "libaux-1.rlib", hijack::placement_strategy::copy);
  CHECK(hijack::test::read_file(tmp / "deps" / "libaux-1.rlib") == "aux");
}

TEST_CASE("inject hard link tracks the source") {
  hijack::test::temp_dir const tmp;
  auto const source{ tmp / "prebuilt.rlib" };
  auto const target{ tmp / "deps" / "libdemo-1.rlib" };
  hijack::test::write_file(source, "v1");
  hijack::test::write_file(target, "dummy");

  hijack::inject(source, target, hijack::placement_strategy::hard_link);
  CHECK(std::filesystem::equivalent(source, target));
  CHECK(std::filesystem::hard_link_count(source) == 2);

  // second run renames a link onto the same inode; the staged sibling must not linger
  hijack::inject(source, target, hijack::placement_strategy::hard_link);
  CHECK(std::filesystem::equivalent(source, target));
  CHECK_FALSE(has_staging_leftovers(tmp / "deps"));

  {
    std::ofstream out{ source, std::ios::binary | std::ios::app };
    out << "+v2";
  }
  CHECK(hijack::test::read_file(target) == "v1+v2");
}

TEST_CASE("inject symbolic link resolves to the live source") {
  hijack::test::temp_dir const tmp;
  auto const source{ tmp / "prebuilt.rlib" };
  auto const target{ tmp / "deps" / "libdemo-1.rlib" };
  hijack::test::write_file(source, "v1");
  hijack::test::write_file(target, "dummy");

  hijack::inject(source, target, hijack::placement_strategy::symbolic_link);
  REQUIRE(std::filesystem::is_symlink(target));
  CHECK(std::filesystem::read_symlink(target) ==
        std::filesystem::absolute(source).lexically_normal());

  hijack::inject(source, target, hijack::placement_strategy::symbolic_link);
  REQUIRE(std::filesystem::is_symlink(target));
  CHECK_FALSE(has_staging_leftovers(tmp / "deps"));

  hijack::test::write_file(source, "v2");
  CHECK(hijack::test::read_file(target) == "v2");
}

TEST_CASE("inject onto itself is a no-op") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_file(tmp / "libself-1.rlib", "same");
  hijack::inject(tmp / "libself-1.rlib",
                 tmp / "sub" / ".." / "libself-1.rlib",
                 hijack::placement_strategy::copy);
  CHECK(hijack::test::read_file(tmp / "libself-1.rlib") == "same");
}

TEST_CASE("inject reports filesystem failures") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_file(tmp / "src.rlib", "x");

  CHECK(hijack::test::error_kind_of([&] {
          hijack::inject(tmp / "missing.rlib", tmp / "target.rlib", hijack::placement_strategy::copy);
        }) == hijack::error_kind::filesystem_error);
  CHECK(hijack::test::error_kind_of([&] {
          hijack::inject(tmp / "src.rlib",
                         tmp / "no-such-dir" / "target.rlib",
                         hijack::placement_strategy::copy);
        }) == hijack::error_kind::filesystem_error);
  CHECK_FALSE(has_staging_leftovers(tmp.path()));
}

TEST_CASE("inject_hard_link_error maps EXDEV to cross_device_link") {
  std::filesystem::path const source{ "/mnt/a/libdemo.rlib" };
  std::filesystem::path const staged{ "/b/deps/.libdemo-1.rlib.hijack-00" };

  auto const cross{ hijack::inject_hard_link_error(
      std::make_error_code(std::errc::cross_device_link), source, staged) };
  CHECK(cross.kind() == hijack::error_kind::cross_device_link);
  CHECK(cross.category() == hijack::error_category::injection);
  CHECK(std::string{ cross.what() }.find("/b/deps") != std::string::npos);

  auto const other{ hijack::inject_hard_link_error(
      std::make_error_code(std::errc::permission_denied), source, staged) };
  CHECK(other.kind() == hijack::error_kind::filesystem_error);
}
