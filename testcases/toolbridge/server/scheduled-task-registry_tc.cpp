
#include "stdinc.hpp"

#include "toolbridge/server/scheduled-task-registry.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <thread>

namespace toolbridge::server::test {

CATCH_TEST_CASE("scheduled-task-registry", "[scheduled-task-registry]") {
  boost::asio::io_context io_context{1};
  std::vector<std::string> published;
  bool is_connected = true;
  ScheduledTaskRegistry registry{io_context.get_executor(), [&](const std::string& message) {
                                   if (!is_connected)
                                     return false;
                                   published.push_back(message);
                                   return true;
                                 }};

  CATCH_SECTION("fires-once-in-due-order") {
    CATCH_REQUIRE(registry.add(40ms, "second").has_value());
    CATCH_REQUIRE(registry.add(10ms, "first").has_value());
    CATCH_REQUIRE(registry.size() == 2);
    io_context.run();

    CATCH_REQUIRE(published == std::vector<std::string>{"first", "second"});
    CATCH_REQUIRE(registry.empty());
    CATCH_REQUIRE(registry.fired() == 2);
  }

  CATCH_SECTION("ids-are-never-reused") {
    const auto a = registry.add(1h, "a");
    const auto b = registry.add(1h, "b");
    CATCH_REQUIRE(a.has_value());
    CATCH_REQUIRE(b.has_value());
    CATCH_REQUIRE(*a == "reminder_1");
    CATCH_REQUIRE(*b == "reminder_2");
    CATCH_REQUIRE(registry.cancel(*a));
    const auto c = registry.add(1h, "c");
    CATCH_REQUIRE(*c == "reminder_3");
    CATCH_REQUIRE(registry.cancel_all() == 2);
  }

  CATCH_SECTION("cancelled-task-never-fires") {
    const auto id = registry.add(10ms, "cancelled");
    CATCH_REQUIRE(registry.add(20ms, "kept").has_value());
    CATCH_REQUIRE(id.has_value());
    CATCH_REQUIRE(registry.cancel(*id));
    CATCH_REQUIRE_FALSE(registry.cancel(*id));
    io_context.run();

    CATCH_REQUIRE(published == std::vector<std::string>{"kept"});
    CATCH_REQUIRE_FALSE(registry.cancel(*id));
  }

  CATCH_SECTION("fired-task-cannot-be-cancelled") {
    const auto id = registry.add(5ms, "done");
    CATCH_REQUIRE(id.has_value());
    io_context.run();
    CATCH_REQUIRE(published.size() == 1);
    CATCH_REQUIRE_FALSE(registry.cancel(*id));
    CATCH_REQUIRE_FALSE(registry.cancel("reminder_999"));
  }

  CATCH_SECTION("non-positive-delay-is-rejected") {
    const auto zero = registry.add(0ms, "now");
    CATCH_REQUIRE(!zero.has_value());
    CATCH_REQUIRE(zero.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
    CATCH_REQUIRE(!registry.add(-5ms, "past").has_value());
    CATCH_REQUIRE(registry.empty());
  }

  CATCH_SECTION("delay-beyond-the-maximum-is-rejected") {
    const auto far = registry.add(24h * 365 * 300, "in 300 years");
    CATCH_REQUIRE(!far.has_value());
    CATCH_REQUIRE(far.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
    CATCH_REQUIRE(!registry.add(ScheduledTaskRegistry::k_max_delay + 1ms, "x").has_value());
    CATCH_REQUIRE(registry.empty());

    const auto longest = registry.add(ScheduledTaskRegistry::k_max_delay, "next year");
    CATCH_REQUIRE(longest.has_value());
    io_context.run_for(50ms);
    CATCH_REQUIRE(published.empty());
    CATCH_REQUIRE(registry.list().front().remaining > ScheduledTaskRegistry::k_max_delay - 1min);
    CATCH_REQUIRE(registry.cancel_all() == 1);
  }

  CATCH_SECTION("list-reports-remaining-time-in-creation-order") {
    CATCH_REQUIRE(registry.add(5min, "later").has_value());
    CATCH_REQUIRE(registry.add(1min, "sooner").has_value());

    const auto tasks = registry.list();
    CATCH_REQUIRE(tasks.size() == 2);
    CATCH_REQUIRE(tasks[0].id == "reminder_1");
    CATCH_REQUIRE(tasks[0].message == "later");
    CATCH_REQUIRE(tasks[0].remaining > 4min);
    CATCH_REQUIRE(tasks[0].remaining <= 5min);
    CATCH_REQUIRE(tasks[1].id == "reminder_2");
    CATCH_REQUIRE(tasks[1].remaining > 50s);
    CATCH_REQUIRE(tasks[1].remaining <= 1min);
    CATCH_REQUIRE(registry.cancel_all() == 2);
  }

  CATCH_SECTION("standup-in-one-minute") {
    const auto id = registry.add(1min, "standup");
    CATCH_REQUIRE(id.has_value());

    const auto first = registry.list();
    CATCH_REQUIRE(first.size() == 1);
    CATCH_REQUIRE(first[0].id == *id);
    CATCH_REQUIRE(first[0].remaining > 59s);
    CATCH_REQUIRE(first[0].remaining <= 60s);

    std::this_thread::sleep_for(5ms);
    const auto second = registry.list();
    CATCH_REQUIRE(second.size() == 1);
    CATCH_REQUIRE(second[0].remaining <= first[0].remaining);
    CATCH_REQUIRE(second[0].remaining >= 0ms);

    CATCH_REQUIRE(registry.cancel(*id));
    CATCH_REQUIRE(registry.list().empty());
    CATCH_REQUIRE_FALSE(registry.cancel(*id));
  }

  CATCH_SECTION("undeliverable-message-is-dropped") {
    is_connected = false;
    CATCH_REQUIRE(registry.add(5ms, "lost").has_value());
    io_context.run();

    CATCH_REQUIRE(published.empty());
    CATCH_REQUIRE(registry.fired() == 1);
    CATCH_REQUIRE(registry.empty());
  }

  CATCH_SECTION("cancel-all-leaves-nothing-to-run") {
    CATCH_REQUIRE(registry.add(1h, "a").has_value());
    CATCH_REQUIRE(registry.add(2h, "b").has_value());
    CATCH_REQUIRE(registry.cancel_all() == 2);
    io_context.run(); // returns at once: the cancelled timers complete immediately
    CATCH_REQUIRE(published.empty());
    CATCH_REQUIRE(registry.list().empty());
  }
}

CATCH_TEST_CASE("scheduled-task-registry-destroyed-with-pending-tasks",
                "[scheduled-task-registry]") {
  boost::asio::io_context io_context{1};
  int n_published = 0;
  {
    ScheduledTaskRegistry registry{io_context.get_executor(), [&](const std::string&) {
                                     ++n_published;
                                     return true;
                                   }};
    CATCH_REQUIRE(registry.add(1ms, "orphan").has_value());
  }
  io_context.run();
  CATCH_REQUIRE(n_published == 0);
}

} // namespace toolbridge::server::test
