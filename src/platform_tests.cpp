#include "platform.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <system_error>

namespace hijack {

TEST_CASE("platform::atomic_rename replaces the destination") {
  test::temp_dir const tmp;
  test::write_file(tmp / "from", "new");
  test::write_file(tmp / "to", "old");

  platform::atomic_rename(tmp / "from", tmp / "to");
  CHECK(test::read_file(tmp / "to") == "new");
  CHECK_FALSE(std::filesystem::exists(tmp / "from"));

  CHECK_THROWS_AS(platform::atomic_rename(tmp / "from", tmp / "to"), std::system_error);
}

TEST_CASE("platform::hard_link reports errors through error_code") {
  test::temp_dir const tmp;
  test::write_file(tmp / "existing", "data");

  std::error_code ec;
  platform::hard_link(tmp / "existing", tmp / "link", ec);
  CHECK_FALSE(ec);
  CHECK(std::filesystem::equivalent(tmp / "existing", tmp / "link"));

  platform::hard_link(tmp / "existing", tmp / "link", ec);
  CHECK(ec);
  CHECK_FALSE(platform::is_cross_device(ec));
  CHECK(platform::is_cross_device(std::make_error_code(std::errc::cross_device_link)));
}

TEST_CASE("platform env var helpers round trip") {
  platform::env_var_set("HIJACK_PLATFORM_TEST_VAR", "value");
  CHECK(platform::env_var_get("HIJACK_PLATFORM_TEST_VAR") == std::optional<std::string>{ "value" });

  platform::env_var_unset("HIJACK_PLATFORM_TEST_VAR");
  CHECK_FALSE(platform::env_var_get("HIJACK_PLATFORM_TEST_VAR").has_value());

  CHECK_THROWS_AS(platform::env_var_get(nullptr), std::invalid_argument);
}

}  // namespace hijack
