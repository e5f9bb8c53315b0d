
#include "stdinc.hpp"

#include "toolbridge/tools/tool-content.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::tools::test {

CATCH_TEST_CASE("tool-content", "[tool-content]") {
  CATCH_SECTION("tool-result-wire-format") {
    const auto payload = encode_tool_result(text_result("hello", true));
    const auto j = nlohmann::json::parse(payload);
    CATCH_REQUIRE(j.at("isError") == true);
    CATCH_REQUIRE(j.at("content").size() == 1);
    CATCH_REQUIRE(j.at("content")[0].at("type") == "text");
    CATCH_REQUIRE(j.at("content")[0].at("text") == "hello");
  }

  CATCH_SECTION("tool-result-decodes-mixed-content") {
    const auto result = decode_tool_result(R"({"content":[
        {"type":"text","text":"line one"},
        {"type":"image","data":"aGVsbG8=","mimeType":"image/png"},
        {"type":"text","text":"line two"}]})");
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE_FALSE(result->is_error);
    CATCH_REQUIRE(result->content.size() == 3);
    CATCH_REQUIRE(result->content[1].mime_type == "image/png");
    CATCH_REQUIRE(result->content[1].data == "aGVsbG8=");
    CATCH_REQUIRE(result->text() == "line one\nline two");

    const auto again = decode_tool_result(encode_tool_result(*result));
    CATCH_REQUIRE(again.has_value());
    CATCH_REQUIRE(*again == *result);
  }

  CATCH_SECTION("bad-payloads-are-data-loss") {
    for (const auto payload : {"", "not json", R"({"content":7})", "[]"}) {
      const auto result = decode_tool_result(payload);
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().error_code() == net::StatusCode::DATA_LOSS);
    }
    CATCH_REQUIRE(!decode_server_info(R"({"version":"1"})").has_value());
    CATCH_REQUIRE(!decode_status_notification(R"({"other":"x"})").has_value());
  }

  CATCH_SECTION("server-info") {
    ServerInfo info{"srv", "2.0", {{"a", "does a"}, {"b", ""}}};
    const auto decoded = decode_server_info(encode_server_info(info));
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(*decoded == info);

    const auto minimal = decode_server_info(R"({"name":"bare"})");
    CATCH_REQUIRE(minimal.has_value());
    CATCH_REQUIRE(minimal->name == "bare");
    CATCH_REQUIRE(minimal->tools.empty());
  }

  CATCH_SECTION("status-notification") {
    const auto payload = encode_status_notification("quote \" and ⏰");
    const auto status = decode_status_notification(payload);
    CATCH_REQUIRE(status.has_value());
    CATCH_REQUIRE(*status == "quote \" and ⏰");
  }

  CATCH_SECTION("arguments-must-be-an-object") {
    const auto empty = parse_arguments("");
    CATCH_REQUIRE(empty.has_value());
    CATCH_REQUIRE(empty->is_object());
    CATCH_REQUIRE(empty->empty());

    CATCH_REQUIRE(parse_arguments(R"({"x":1})").has_value());
    for (const auto payload : {"[1,2]", "42", "{broken"}) {
      const auto args = parse_arguments(payload);
      CATCH_REQUIRE(!args.has_value());
      CATCH_REQUIRE(args.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
    }
  }
}

} // namespace toolbridge::tools::test
