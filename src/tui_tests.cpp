#include "tui.h"

#include "doctest/doctest.h"

#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(hijack::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(hijack::tui::set_output_handler(handler));
  CHECK_NOTHROW(hijack::tui::run(hijack::tui::level::TUI_INFO));
  CHECK_THROWS_AS(hijack::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(hijack::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(hijack::tui::shutdown());
  CHECK_THROWS_AS(hijack::tui::shutdown(), std::logic_error);
  CHECK_NOTHROW(hijack::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::mutex mutex;
  std::vector<std::string> messages;

  captured_output() {
    hijack::tui::set_output_handler([this](std::string_view text) {
      std::lock_guard<std::mutex> lock{ mutex };
      messages.emplace_back(text);
    });
  }

  ~captured_output() { hijack::tui::set_output_handler([](std::string_view) {}); }
};

}  // namespace

TEST_CASE("tui filters by threshold and flushes on shutdown") {
  captured_output capture;
  hijack::tui::run(hijack::tui::level::TUI_WARN);
  hijack::tui::debug("hidden %d", 1);
  hijack::tui::info("hidden %d", 2);
  hijack::tui::warn("shown %s", "warn");
  hijack::tui::error("shown %s", "error");
  hijack::tui::shutdown();

  REQUIRE(capture.messages.size() == 2);
  CHECK(capture.messages[0] == "shown warn\n");
  CHECK(capture.messages[1] == "shown error\n");
}

TEST_CASE("tui decorated output carries timestamp and level") {
  captured_output capture;
  hijack::tui::run(hijack::tui::level::TUI_DEBUG, true);
  hijack::tui::debug("detail");
  hijack::tui::shutdown();

  REQUIRE(capture.messages.size() == 1);
  std::regex const pattern{
    R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[DBG\] detail\n$)"
  };
  CHECK(std::regex_match(capture.messages[0], pattern));
}

TEST_CASE("tui formats long messages") {
  captured_output capture;
  hijack::tui::run(hijack::tui::level::TUI_INFO);
  std::string const long_text(4096, 'x');
  hijack::tui::info("%s!", long_text.c_str());
  hijack::tui::shutdown();

  REQUIRE(capture.messages.size() == 1);
  CHECK(capture.messages[0] == long_text + "!\n");
}

TEST_CASE("tui scope runs and shuts down") {
  captured_output capture;
  {
    hijack::tui::scope const scope{ hijack::tui::level::TUI_INFO, false };
    hijack::tui::info("inside");
  }
  REQUIRE(capture.messages.size() == 1);
  CHECK(capture.messages[0] == "inside\n");
}
