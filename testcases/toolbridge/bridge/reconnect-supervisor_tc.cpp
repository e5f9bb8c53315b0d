
#include "stdinc.hpp"

#include "toolbridge/bridge/reconnect-supervisor.hpp"
#include "toolbridge/net/asio-execution-context.hpp"
#include "toolbridge/test-worker.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/post.hpp>

namespace toolbridge::bridge::test {

using toolbridge::test::eventually;
using toolbridge::test::InProcessWorker;

CATCH_TEST_CASE("reconnect-supervisor", "[reconnect-supervisor]") {
  InProcessWorker worker{nullptr};
  net::AsioExecutionContext context;
  std::atomic<int> n_connected{0};

  auto supervisor = std::make_unique<ReconnectSupervisor>(context.get_executor(), worker.factory(),
                                                          30ms, net::SessionConfig{"sv-test", 1s});
  supervisor->set_on_connected([&n_connected](shared_ptr<net::RpcSession> session) {
    if (session != nullptr && session->is_open())
      n_connected.fetch_add(1);
  });

  auto stop_supervisor = [&]() {
    boost::asio::post(context.get_executor(), [&]() { supervisor->stop(); });
    context.stop();
  };

  CATCH_SECTION("connects-once-started") {
    CATCH_REQUIRE(supervisor->state() == ReconnectSupervisor::State::IDLE);
    CATCH_REQUIRE(supervisor->generation() == 0);

    context.run();
    boost::asio::post(context.get_executor(), [&]() { supervisor->start(); });
    CATCH_REQUIRE(eventually([&]() { return supervisor->is_ready(); }));
    CATCH_REQUIRE(supervisor->state() == ReconnectSupervisor::State::CONNECTED);
    CATCH_REQUIRE(supervisor->attempts() == 1);
    CATCH_REQUIRE(n_connected.load() == 1);

    stop_supervisor();
    CATCH_REQUIRE(supervisor->state() == ReconnectSupervisor::State::IDLE);
    CATCH_REQUIRE(supervisor->generation() == 0);
  }

  CATCH_SECTION("generation-changes-with-every-connection") {
    context.run();
    boost::asio::post(context.get_executor(), [&]() { supervisor->start(); });
    CATCH_REQUIRE(eventually([&]() { return supervisor->is_ready(); }));
    const auto first = supervisor->generation();

    worker.drop_connections();
    CATCH_REQUIRE(eventually([&]() { return supervisor->connections() == 2; }));
    CATCH_REQUIRE(eventually([&]() { return supervisor->is_ready(); }));
    CATCH_REQUIRE(supervisor->generation() > first);
    CATCH_REQUIRE(n_connected.load() == 2);

    stop_supervisor();
  }

  CATCH_SECTION("backs-off-between-failed-attempts") {
    worker.set_refuse(true);
    context.run();
    const auto started = std::chrono::steady_clock::now();
    boost::asio::post(context.get_executor(), [&]() { supervisor->start(); });

    CATCH_REQUIRE(eventually([&]() { return supervisor->attempts() >= 4; }));
    // Three delays of 30ms separate the first and fourth attempt
    CATCH_REQUIRE(std::chrono::steady_clock::now() - started >= 90ms);
    CATCH_REQUIRE_FALSE(supervisor->is_ready());
    CATCH_REQUIRE(supervisor->connections() == 0);

    stop_supervisor();
    CATCH_REQUIRE(supervisor->state() == ReconnectSupervisor::State::IDLE);
  }

  CATCH_SECTION("missing-factory-is-a-failed-attempt") {
    auto orphan = std::make_unique<ReconnectSupervisor>(context.get_executor(), nullptr, 10ms);
    context.run();
    boost::asio::post(context.get_executor(), [&]() { orphan->start(); });
    CATCH_REQUIRE(eventually([&]() { return orphan->attempts() >= 2; }));
    CATCH_REQUIRE_FALSE(orphan->is_ready());
    boost::asio::post(context.get_executor(), [&]() { orphan->stop(); });
    context.stop();
  }

  // The supervisor's timer must die before the context does
  context.stop();
  supervisor.reset();
}

} // namespace toolbridge::bridge::test
