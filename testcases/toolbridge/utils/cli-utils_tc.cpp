#include "toolbridge/utils/cli-utils.hpp"

#include "stdinc.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::cli::tests {

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("safe-args") {
    std::vector<std::string> args = parse_cmd_args("exec-name 1 two 2.5 -3");
    std::vector<char*> argv_s;
    int argc = int(args.size());
    for (auto i = 0; i < argc; ++i)
      argv_s.push_back(args[i].data());
    char** argv = argv_s.data();

    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_seconds(argc, argv, i) == 2500ms);
    CATCH_REQUIRE(i == 3);
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == -3);
    CATCH_REQUIRE(i == 4);
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);

    i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error); // "two"
    i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_seconds(argc, argv, i), std::runtime_error); // "-3"
  }

  CATCH_SECTION("parse-cmd-args") {
    CATCH_REQUIRE(parse_cmd_args("").empty());
    CATCH_REQUIRE(parse_cmd_args("  reminder-server  ") == std::vector<std::string>{"reminder-server"});
    CATCH_REQUIRE(parse_cmd_args(R"(python3 "my server.py" --log 'a b' x\ y)") ==
                  std::vector<std::string>{"python3", "my server.py", "--log", "a b", "x y"});
    CATCH_REQUIRE(parse_cmd_args(R"(say "" 'it''s')") ==
                  std::vector<std::string>{"say", "", "its"});
    CATCH_REQUIRE_THROWS_AS(parse_cmd_args(R"(open "quote)"), std::runtime_error);
  }
}

} // namespace toolbridge::cli::tests
