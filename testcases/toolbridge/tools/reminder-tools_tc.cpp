
#include "stdinc.hpp"

#include "toolbridge/tools/reminder-client.hpp"
#include "toolbridge/tools/reminder-tools.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/io_context.hpp>

#include <thread>

namespace toolbridge::tools::test {

namespace {
  std::string result_text(const expected<std::string, net::Status>& payload) {
    if (!payload.has_value())
      return payload.error().to_string();
    const auto result = decode_tool_result(*payload);
    return result.has_value() ? result->text() : result.error().to_string();
  }
} // namespace

CATCH_TEST_CASE("format-time-left", "[reminder-tools]") {
  CATCH_REQUIRE(format_time_left(0ms) == "Due any moment!");
  CATCH_REQUIRE(format_time_left(59'999ms) == "Due any moment!");
  CATCH_REQUIRE(format_time_left(1min) == "Due in 1 minute");
  CATCH_REQUIRE(format_time_left(119s) == "Due in 1 minute");
  CATCH_REQUIRE(format_time_left(2min) == "Due in 2 minutes");
  CATCH_REQUIRE(format_time_left(4min + 59s) == "Due in 4 minutes");
  CATCH_REQUIRE(format_time_left(90min) == "Due in 90 minutes");
}

CATCH_TEST_CASE("reminder-tools", "[reminder-tools]") {
  boost::asio::io_context io_context{1};
  std::vector<std::string> published;
  server::ScheduledTaskRegistry registry{io_context.get_executor(),
                                         [&published](const std::string& message) {
                                           published.push_back(message);
                                           return true;
                                         }};
  ReminderTools reminder_tools{registry};

  CATCH_SECTION("set-reminder-in-minutes") {
    const auto text =
        result_text(reminder_tools.set_reminder(R"({"minutes":5,"message":"stretch"})"));
    CATCH_REQUIRE(text == "✅ Reminder set! Will notify in 5 minutes\nID: reminder_1");
    CATCH_REQUIRE(registry.size() == 1);
    CATCH_REQUIRE(registry.list().front().message == "stretch");
  }

  CATCH_SECTION("set-reminder-in-seconds-fires") {
    const auto text =
        result_text(reminder_tools.set_reminder(R"({"seconds":0.02,"message":"tea"})"));
    CATCH_REQUIRE(text == "✅ Reminder set! Will notify in 0.02 seconds\nID: reminder_1");
    io_context.run();
    CATCH_REQUIRE(published == std::vector<std::string>{"tea"});
  }

  CATCH_SECTION("bad-arguments-are-rejected") {
    for (const auto payload : {R"({"minutes":0,"message":"x"})", R"({"minutes":1.5,"message":"x"})",
                               R"({"minutes":"2","message":"x"})", R"({"seconds":-1,"message":"x"})",
                               R"({"minutes":2})", R"({"message":"no delay"})", R"([1])"}) {
      const auto result = reminder_tools.set_reminder(payload);
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
    }
    CATCH_REQUIRE(registry.empty());
    CATCH_REQUIRE(!reminder_tools.cancel_reminder(R"({"task_id":7})").has_value());
  }

  CATCH_SECTION("far-future-delays-are-rejected") {
    for (const auto payload :
         {R"({"seconds":1e300,"message":"far future"})", R"({"seconds":31536001,"message":"x"})",
          R"({"minutes":525601,"message":"x"})",
          R"({"minutes":9223372036854775807,"message":"x"})"}) {
      const auto result = reminder_tools.set_reminder(payload);
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
    }
    CATCH_REQUIRE(registry.empty());

    // The longest accepted delay is scheduled in the future
    CATCH_REQUIRE(
        reminder_tools.set_reminder(R"({"minutes":525600,"message":"next year"})").has_value());
    const auto tasks = registry.list();
    CATCH_REQUIRE(tasks.size() == 1);
    CATCH_REQUIRE(tasks[0].remaining > server::ScheduledTaskRegistry::k_max_delay - 1min);
    io_context.run_for(50ms);
    CATCH_REQUIRE(published.empty());
    registry.cancel_all();
  }

  CATCH_SECTION("cancel-reminder") {
    CATCH_REQUIRE(reminder_tools.set_reminder(R"({"minutes":3,"message":"call home"})").has_value());
    CATCH_REQUIRE(result_text(reminder_tools.cancel_reminder(R"({"task_id":"reminder_1"})")) ==
                  "✅ Cancelled reminder: reminder_1");
    CATCH_REQUIRE(result_text(reminder_tools.cancel_reminder(R"({"task_id":"reminder_1"})")) ==
                  "❌ Reminder not found: reminder_1");
    CATCH_REQUIRE(registry.empty());
  }

  CATCH_SECTION("list-reminders") {
    CATCH_REQUIRE(result_text(reminder_tools.list_reminders("{}")) == "No active reminders");
    CATCH_REQUIRE(reminder_tools.set_reminder(R"({"minutes":5,"message":"a"})").has_value());
    CATCH_REQUIRE(reminder_tools.set_reminder(R"({"minutes":1,"message":"b"})").has_value());
    std::this_thread::sleep_for(2ms);
    CATCH_REQUIRE(result_text(reminder_tools.list_reminders("")) ==
                  "Active reminders:\n• reminder_1 (Due in 4 minutes)\n"
                  "• reminder_2 (Due any moment!)");
    registry.cancel_all();
  }

  CATCH_SECTION("reminder-notification-payload") {
    const auto status = decode_status_notification(reminder_notification("stand up"));
    CATCH_REQUIRE(status.has_value());
    CATCH_REQUIRE(*status == "⏰ Reminder: stand up");
  }

  CATCH_SECTION("server-info-lists-the-tools") {
    const auto info = ReminderTools::server_info();
    CATCH_REQUIRE(info.name == "reminder-server");
    CATCH_REQUIRE(info.tools.size() == 3);
    CATCH_REQUIRE(info.tools[0].name == "set_reminder");
    CATCH_REQUIRE(info.tools[1].name == "cancel_reminder");
    CATCH_REQUIRE(info.tools[2].name == "list_reminders");
  }
}

CATCH_TEST_CASE("describe-result", "[reminder-client]") {
  const std::string rule(50, '=');

  CATCH_REQUIRE(describe_result(make_unexpected(net::Status{net::StatusCode::NOT_READY})) ==
                "Server not ready, please wait...");
  CATCH_REQUIRE(describe_result(make_unexpected(
                    net::Status{net::StatusCode::DEADLINE_EXCEEDED, "too slow"})) ==
                format("{0}\nERROR OCCURRED!\n{0}\nError: DEADLINE_EXCEEDED: too slow\n{0}", rule));
  CATCH_REQUIRE(describe_result(text_result("✅ done")) ==
                format("{0}\nSUCCESS!\n{0}\n✅ done\n{0}", rule));
  CATCH_REQUIRE(describe_result(text_result("❌ nope")) ==
                format("{0}\nERROR!\n{0}\n❌ nope\n{0}", rule));
  CATCH_REQUIRE(describe_result(text_result("plain", true)) ==
                format("{0}\nERROR!\n{0}\nplain\n{0}", rule));
  CATCH_REQUIRE(describe_result(text_result("No active reminders")) == "No active reminders");
}

} // namespace toolbridge::tools::test
