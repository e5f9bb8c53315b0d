
#include "stdinc.hpp"

#include "toolbridge/test-worker.hpp"
#include "toolbridge/tools/reminder-client.hpp"
#include "toolbridge/tools/reminder-tools.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::tools::test {

using toolbridge::test::eventually;
using toolbridge::test::InProcessWorker;

CATCH_TEST_CASE("reminder-client", "[reminder-client]") {
  // Set once the registry exists; read on the worker's thread
  std::atomic<ReminderTools*> current_tools{nullptr};
  std::atomic<net::RpcServer*> current_server{nullptr};

  InProcessWorker worker{[&](net::RpcServer& server) {
    current_server.store(&server);
    if (auto* reminder_tools = current_tools.load())
      reminder_tools->install(server);
  }};

  server::ScheduledTaskRegistry registry{worker.get_executor(), [&](const std::string& message) {
                                           auto* server = current_server.load();
                                           return server != nullptr &&
                                                  server->notify(reminder_notification(message));
                                         }};
  ReminderTools reminder_tools{registry};
  current_tools.store(&reminder_tools);

  bridge::BridgeConfig config;
  config.transport_factory = worker.factory();
  config.reconnect_delay = 50ms;
  config.default_timeout = 2s;
  bridge::SessionBridge bridge{std::move(config)};
  ReminderClient client{bridge};

  CATCH_REQUIRE(client.tools().empty());
  CATCH_REQUIRE(describe_result(client.list_reminders()) == "Server not ready, please wait...");

  bridge.start();
  CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

  CATCH_SECTION("set-list-cancel") {
    const auto set = client.set_reminder(2, "water the plants");
    CATCH_REQUIRE(set.has_value());
    CATCH_REQUIRE(set->text() == "✅ Reminder set! Will notify in 2 minutes\nID: reminder_1");

    const auto listed = client.list_reminders();
    CATCH_REQUIRE(listed.has_value());
    CATCH_REQUIRE(listed->text() == "Active reminders:\n• reminder_1 (Due in 1 minute)");

    const auto cancelled = client.cancel_reminder("reminder_1");
    CATCH_REQUIRE(cancelled.has_value());
    CATCH_REQUIRE(cancelled->text() == "✅ Cancelled reminder: reminder_1");

    const auto missing = client.cancel_reminder("reminder_1");
    CATCH_REQUIRE(missing.has_value());
    CATCH_REQUIRE(describe_result(missing).find("ERROR!") != std::string::npos);
  }

  CATCH_SECTION("invalid-minutes-is-an-error-status") {
    const auto result = client.set_reminder(0, "never");
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
  }

  CATCH_SECTION("tools-come-from-the-handshake") {
    // The test worker's handshake reply advertises no tools
    CATCH_REQUIRE(client.tools().empty());
    CATCH_REQUIRE(bridge.server_info() == InProcessWorker::server_info());
  }

  CATCH_SECTION("fired-reminder-arrives-as-a-notification") {
    const auto set = bridge.request("set_reminder", R"({"seconds":0.05,"message":"stretch"})");
    CATCH_REQUIRE(set.has_value());

    auto notification = bridge.notifications().wait_pop(5s);
    CATCH_REQUIRE(notification.has_value());
    const auto status = decode_status_notification(notification->payload);
    CATCH_REQUIRE(status.has_value());
    CATCH_REQUIRE(*status == "⏰ Reminder: stretch");
  }

  bridge.stop();
  current_server.store(nullptr);
  // Pending timers must be cancelled on the thread that runs them
  std::atomic<bool> is_cleared{false};
  boost::asio::post(worker.get_executor(), [&registry, &is_cleared]() {
    registry.cancel_all();
    is_cleared.store(true);
  });
  CATCH_REQUIRE(eventually([&]() { return is_cleared.load(); }));
}

} // namespace toolbridge::tools::test
