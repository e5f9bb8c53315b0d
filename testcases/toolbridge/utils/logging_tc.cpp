
#include "stdinc.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::logging::test {

CATCH_TEST_CASE("logging", "[logging]") {
  CATCH_SECTION("default-logger-writes-to-stderr") {
    auto& logger = debug_logger();
    CATCH_REQUIRE(logger.name() == "toolbridge");
    CATCH_REQUIRE(&logger == &debug_logger());
    CATCH_REQUIRE(logger.sinks().size() == 1);
    CATCH_REQUIRE(logger.sinks().front() != nullptr);
    WARN("logging test: {} {}", "warn", 1);
  }

  CATCH_SECTION("unwritable-log-file-keeps-the-default-logger") {
    CATCH_REQUIRE_FALSE(init_file_logger("/nonexistent-directory/toolbridge.log"));
    CATCH_REQUIRE(debug_logger().name() == "toolbridge");
  }
}

} // namespace toolbridge::logging::test
