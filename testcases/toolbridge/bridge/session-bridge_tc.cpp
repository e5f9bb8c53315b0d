
#include "stdinc.hpp"

#include "toolbridge/bridge/session-bridge.hpp"
#include "toolbridge/test-worker.hpp"

#include <catch2/catch_all.hpp>

namespace toolbridge::bridge::test {

using toolbridge::test::eventually;
using toolbridge::test::InProcessWorker;

namespace {
  void install_tools(net::RpcServer& server) {
    server.register_handler("echo", [](const std::string& payload) -> net::CallResult {
      return payload;
    });
    server.register_handler("burst", [&server](const std::string& payload) -> net::CallResult {
      const auto count = std::stoi(payload);
      for (int i = 0; i < count; ++i)
        server.notify(format("note-{}", i));
      return "sent";
    });
    server.register_handler("crash", [&server](const std::string&) -> net::CallResult {
      server.close();
      return "never delivered";
    });
  }

  BridgeConfig make_config(InProcessWorker& worker, std::size_t capacity = 0) {
    BridgeConfig config;
    config.transport_factory = worker.factory();
    config.reconnect_delay = 50ms;
    config.default_timeout = 2s;
    config.notification_capacity = capacity;
    config.session.client_name = "bridge-test";
    config.session.handshake_timeout = 1s;
    return config;
  }

  std::vector<std::string> payloads(const std::vector<net::Notification>& notifications) {
    std::vector<std::string> out;
    for (const auto& notification : notifications)
      out.push_back(notification.payload);
    return out;
  }
} // namespace

CATCH_TEST_CASE("session-bridge", "[session-bridge]") {
  // The worker must outlive the bridge
  InProcessWorker worker{install_tools};

  CATCH_SECTION("not-ready-before-start") {
    SessionBridge bridge{make_config(worker)};
    CATCH_REQUIRE_FALSE(bridge.is_ready());

    const auto started = std::chrono::steady_clock::now();
    const auto result = bridge.request("echo", "hello", 1s);
    CATCH_REQUIRE(std::chrono::steady_clock::now() - started < 500ms);
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == net::StatusCode::NOT_READY);
    CATCH_REQUIRE(worker.connections() == 0);
  }

  CATCH_SECTION("request-returns-the-response") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    CATCH_REQUIRE(bridge.state() == ReconnectSupervisor::State::CONNECTED);
    CATCH_REQUIRE(bridge.server_info() == InProcessWorker::server_info());

    const auto result = bridge.request("echo", R"({"text":"hello"})");
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(*result == R"({"text":"hello"})");

    const auto unknown = bridge.request("no_such_tool", "{}");
    CATCH_REQUIRE(!unknown.has_value());
    CATCH_REQUIRE(unknown.error().error_code() == net::StatusCode::UNIMPLEMENTED);
  }

  CATCH_SECTION("requests-from-many-threads") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

    constexpr int k_n_threads = 8;
    constexpr int k_n_requests = 25;
    std::atomic<int> n_correct{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < k_n_threads; ++t) {
      threads.emplace_back([&bridge, &n_correct, t]() {
        for (int i = 0; i < k_n_requests; ++i) {
          const auto payload = format("{}-{}", t, i);
          const auto result = bridge.request("echo", payload);
          if (result.has_value() && *result == payload)
            n_correct.fetch_add(1);
        }
      });
    }
    for (auto& thread : threads)
      thread.join();

    CATCH_REQUIRE(n_correct.load() == k_n_threads * k_n_requests);
  }

  CATCH_SECTION("session-loss-fails-the-request-and-reconnects") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    const auto first_generation = bridge.supervisor().generation();

    const auto result = bridge.request("crash", "{}");
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == net::StatusCode::CONNECTION_LOST);

    CATCH_REQUIRE(eventually([&]() { return bridge.supervisor().connections() == 2; }));
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    CATCH_REQUIRE(bridge.supervisor().generation() != first_generation);
    CATCH_REQUIRE(worker.connections() == 2);

    const auto after = bridge.request("echo", "again");
    CATCH_REQUIRE(after.has_value());
    CATCH_REQUIRE(*after == "again");
  }

  CATCH_SECTION("worker-crash-is-survived") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

    worker.drop_connections();
    CATCH_REQUIRE(eventually([&]() { return bridge.supervisor().connections() >= 2; }));
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    CATCH_REQUIRE(bridge.request("echo", "still here").has_value());
  }

  CATCH_SECTION("connect-retries-until-the-worker-accepts") {
    worker.set_refuse(true);
    SessionBridge bridge{make_config(worker)};
    bridge.start();

    CATCH_REQUIRE(eventually([&]() { return bridge.supervisor().attempts() >= 3; }));
    CATCH_REQUIRE_FALSE(bridge.is_ready());
    const auto refused = bridge.request("echo", "x", 100ms);
    CATCH_REQUIRE(!refused.has_value());
    CATCH_REQUIRE(refused.error().error_code() == net::StatusCode::NOT_READY);

    worker.set_refuse(false);
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    CATCH_REQUIRE(bridge.supervisor().connections() == 1);
  }

  CATCH_SECTION("notifications-are-relayed-in-order") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

    CATCH_REQUIRE(bridge.request("burst", "4").has_value());
    CATCH_REQUIRE(eventually([&]() { return bridge.notifications().size() == 4; }));

    const auto received = bridge.notifications().drain();
    CATCH_REQUIRE(payloads(received) ==
                  std::vector<std::string>{"note-0", "note-1", "note-2", "note-3"});
    for (std::size_t i = 1; i < received.size(); ++i)
      CATCH_REQUIRE(received[i - 1].timestamp <= received[i].timestamp);
  }

  CATCH_SECTION("full-notification-queue-drops-the-oldest") {
    SessionBridge bridge{make_config(worker, 2)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

    CATCH_REQUIRE(bridge.request("burst", "5").has_value());
    auto& queue = bridge.notifications();
    CATCH_REQUIRE(eventually([&]() { return queue.dropped() == 3; }));
    CATCH_REQUIRE(payloads(queue.drain()) == std::vector<std::string>{"note-3", "note-4"});
  }

  CATCH_SECTION("stop-ends-everything") {
    SessionBridge bridge{make_config(worker)};
    bridge.start();
    CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));
    bridge.stop();

    CATCH_REQUIRE_FALSE(bridge.is_ready());
    CATCH_REQUIRE(bridge.state() == ReconnectSupervisor::State::IDLE);
    CATCH_REQUIRE(bridge.notifications().is_closed());
    const auto result = bridge.request("echo", "late", 100ms);
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == net::StatusCode::NOT_READY);

    bridge.start(); // no restart after stop
    CATCH_REQUIRE_FALSE(bridge.is_ready());
  }
}

CATCH_TEST_CASE("session-bridge-deadline", "[session-bridge]") {
  InProcessWorker worker{nullptr, true};
  SessionBridge bridge{make_config(worker)};
  bridge.start();
  CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

  const auto started = std::chrono::steady_clock::now();
  const auto result = bridge.request("anything", "{}", 100ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  CATCH_REQUIRE(!result.has_value());
  CATCH_REQUIRE(result.error().error_code() == net::StatusCode::DEADLINE_EXCEEDED);
  CATCH_REQUIRE(elapsed >= 100ms);
  CATCH_REQUIRE(elapsed < 1s);

  // The session survives a timed-out call
  CATCH_REQUIRE(bridge.is_ready());
  CATCH_REQUIRE(bridge.supervisor().connections() == 1);
}

CATCH_TEST_CASE("session-bridge-rejects-non-positive-timeouts", "[session-bridge]") {
  InProcessWorker worker{nullptr, true};
  SessionBridge bridge{make_config(worker)};
  bridge.start();
  CATCH_REQUIRE(eventually([&]() { return bridge.is_ready(); }));

  for (const auto timeout : {0ms, -5ms}) {
    const auto started = std::chrono::steady_clock::now();
    const auto result = bridge.request("anything", "{}", timeout);
    CATCH_REQUIRE(std::chrono::steady_clock::now() - started < 100ms);
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
  }

  auto config = make_config(worker);
  config.default_timeout = 0ms;
  SessionBridge misconfigured{std::move(config)};
  const auto result = misconfigured.request("anything", "{}");
  CATCH_REQUIRE(!result.has_value());
  CATCH_REQUIRE(result.error().error_code() == net::StatusCode::INVALID_ARGUMENT);
}

CATCH_TEST_CASE("session-bridge-start-races-stop", "[session-bridge]") {
  InProcessWorker worker{install_tools};
  for (int i = 0; i < 20; ++i) {
    SessionBridge bridge{make_config(worker)};
    std::thread starter{[&bridge]() { bridge.start(); }};
    bridge.stop();
    starter.join();
    bridge.stop();

    CATCH_REQUIRE_FALSE(bridge.is_ready());
    CATCH_REQUIRE(bridge.state() == ReconnectSupervisor::State::IDLE);
    CATCH_REQUIRE(bridge.notifications().is_closed());
  }
}

} // namespace toolbridge::bridge::test
