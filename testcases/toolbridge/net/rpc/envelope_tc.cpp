
#include "stdinc.hpp"

#include "toolbridge/net/rpc/envelope.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::net::detail::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("envelope", "[envelope]") {
  //

  CATCH_SECTION("request-envelope") {
    BufferType buffer;
    CATCH_REQUIRE(encode_request(buffer, 1234567890123ull, 10'000, "set_reminder",
                                 R"({"minutes":5,"message":"standup"})"));
    CATCH_REQUIRE(peek_kind(to_span_bytes(buffer)) == EnvelopeKind::REQUEST);

    RequestEnvelopeHeader header;
    CATCH_REQUIRE(decode(header, to_span_bytes(buffer)));
    CATCH_REQUIRE(header.request_id == 1234567890123ull);
    CATCH_REQUIRE(header.deadline_millis == 10'000);
    CATCH_REQUIRE(header.method == "set_reminder");
    CATCH_REQUIRE(to_string_view(header.payload) == R"({"minutes":5,"message":"standup"})");

    // Header is big endian: kind, then the request id
    CATCH_REQUIRE(std::to_integer<int>(buffer[0]) == 1);
    CATCH_REQUIRE(std::to_integer<int>(buffer[8]) == (1234567890123ull & 0xff));
  }

  CATCH_SECTION("request-envelope-empty-payload") {
    BufferType buffer;
    CATCH_REQUIRE(encode_request(buffer, 1, 0, "list_reminders", ""));
    RequestEnvelopeHeader header;
    CATCH_REQUIRE(decode(header, to_span_bytes(buffer)));
    CATCH_REQUIRE(header.deadline_millis == 0);
    CATCH_REQUIRE(header.payload.size() == 0);
  }

  CATCH_SECTION("response-envelope") {
    auto test_response = [](uint64_t request_id, Status status, std::string_view payload) {
      BufferType buffer;
      ResponseEnvelopeHeader header;
      CATCH_REQUIRE(encode_response(buffer, request_id, status, payload));
      CATCH_REQUIRE(peek_kind(to_span_bytes(buffer)) == EnvelopeKind::RESPONSE);
      CATCH_REQUIRE(decode(header, to_span_bytes(buffer)));
      CATCH_REQUIRE(header.request_id == request_id);
      CATCH_REQUIRE(header.status == status);
      CATCH_REQUIRE(to_string_view(header.payload) == payload);
    };

    test_response(0, Status{}, "");
    test_response(7, Status{}, "result");
    test_response(8, Status{StatusCode::UNIMPLEMENTED, "unknown tool: foo"}, "");
    test_response(9, Status{StatusCode::REMOTE_ERROR, "message", "details"}, "");
  }

  CATCH_SECTION("notification-envelope") {
    BufferType buffer;
    CATCH_REQUIRE(encode_notification(buffer, R"({"status":"hello"})"));
    CATCH_REQUIRE(peek_kind(to_span_bytes(buffer)) == EnvelopeKind::NOTIFICATION);
    NotificationEnvelopeHeader header;
    CATCH_REQUIRE(decode(header, to_span_bytes(buffer)));
    CATCH_REQUIRE(to_string_view(header.payload) == R"({"status":"hello"})");
  }

  CATCH_SECTION("truncated-envelopes-are-rejected") {
    BufferType buffer;
    CATCH_REQUIRE(encode_response(buffer, 42, Status{StatusCode::INTERNAL, "boom", "x"}, ""));
    for (std::size_t size = 0; size < buffer.size(); ++size) {
      ResponseEnvelopeHeader header;
      CATCH_REQUIRE_FALSE(decode(header, {buffer.data(), size}));
    }

    CATCH_REQUIRE(encode_request(buffer, 42, 0, "method", ""));
    for (std::size_t size = 0; size < buffer.size(); ++size) {
      RequestEnvelopeHeader header;
      CATCH_REQUIRE_FALSE(decode(header, {buffer.data(), size}));
    }
  }

  CATCH_SECTION("wrong-kind-is-rejected") {
    BufferType buffer;
    CATCH_REQUIRE(encode_notification(buffer, "payload"));
    RequestEnvelopeHeader request;
    ResponseEnvelopeHeader response;
    CATCH_REQUIRE_FALSE(decode(request, to_span_bytes(buffer)));
    CATCH_REQUIRE_FALSE(decode(response, to_span_bytes(buffer)));

    buffer[0] = std::byte{9};
    CATCH_REQUIRE_FALSE(peek_kind(to_span_bytes(buffer)).has_value());
    CATCH_REQUIRE_FALSE(peek_kind({}).has_value());
  }
}

} // namespace toolbridge::net::detail::test
