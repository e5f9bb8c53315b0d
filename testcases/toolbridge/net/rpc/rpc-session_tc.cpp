
#include "stdinc.hpp"

#include "toolbridge/net/co-spawn.hpp"
#include "toolbridge/net/pipe-transport.hpp"
#include "toolbridge/net/rpc/rpc-server.hpp"
#include "toolbridge/net/rpc/rpc-session.hpp"

#include "toolbridge/test-worker.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

namespace toolbridge::net::test {

using boost::asio::awaitable;

namespace {
  struct Connection {
    shared_ptr<RpcSession> session;
    shared_ptr<RpcServer> server;
  };

  // Client and server share the (single threaded) io_context of the test
  Connection connect(boost::asio::io_context& io_context,
                     std::function<void(shared_ptr<RpcServer>)> setup) {
    auto pair = make_pipe_pair(io_context.get_executor(), io_context.get_executor());
    if (!pair.has_value())
      throw std::runtime_error(format("make_pipe_pair: {}", pair.error().message()));
    auto server = make_shared<RpcServer>(pair->second, R"({"name":"session-test"})");
    setup(server);
    boost::asio::co_spawn(io_context, server->run(),
                          [](std::exception_ptr ex_ptr, error_code) {
                            log_on_exception("session-test server")(ex_ptr);
                          });
    auto session = make_shared<RpcSession>(pair->first, SessionConfig{"session-test", 1s});
    return {session, server};
  }

  void install_echo(shared_ptr<RpcServer> server) {
    server->register_handler("echo", [](const std::string& payload) -> expected<std::string, Status> {
      return payload;
    });
  }
} // namespace

CATCH_TEST_CASE("rpc-session", "[rpc-session]") {
  boost::asio::io_context io_context{1};

  CATCH_SECTION("handshake-returns-server-info") {
    auto [session, server] = connect(io_context, install_echo);
    CallResult result;
    RpcSession::State state_after_open{};

    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          result = co_await session->async_open();
          state_after_open = session->state();
          session->close("test done");
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(*result == R"({"name":"session-test"})");
    CATCH_REQUIRE(state_after_open == RpcSession::State::READY);
    CATCH_REQUIRE(session->server_info() == *result);
    CATCH_REQUIRE(session->is_closed());
  }

  CATCH_SECTION("second-open-is-refused") {
    auto [session, server] = connect(io_context, install_echo);
    CallResult first, second;
    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          first = co_await session->async_open();
          second = co_await session->async_open();
          session->close("test done");
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(first.has_value());
    CATCH_REQUIRE(!second.has_value());
    CATCH_REQUIRE(second.error().error_code() == StatusCode::FAILED_PRECONDITION);
  }

  CATCH_SECTION("calls-are-matched-by-id") {
    auto [session, server] = connect(io_context, install_echo);
    constexpr int k_n_calls = 20;
    std::vector<CallResult> results(k_n_calls);
    int n_finished = 0;

    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          co_await session->async_open();
          // All calls are in flight at once
          for (int i = 0; i < k_n_calls; ++i) {
            boost::asio::co_spawn(
                io_context,
                [&, i, session]() -> awaitable<void> {
                  results[size_t(i)] = co_await session->async_call("echo", format("call-{}", i), 1s);
                  if (++n_finished == k_n_calls)
                    session->close("test done");
                },
                boost::asio::detached);
          }
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(n_finished == k_n_calls);
    for (int i = 0; i < k_n_calls; ++i) {
      CATCH_REQUIRE(results[size_t(i)].has_value());
      CATCH_REQUIRE(*results[size_t(i)] == format("call-{}", i));
    }
    CATCH_REQUIRE(session->outstanding_calls() == 0);
  }

  CATCH_SECTION("unknown-method-is-unimplemented") {
    auto [session, server] = connect(io_context, install_echo);
    CallResult result;
    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          co_await session->async_open();
          result = co_await session->async_call("no_such_tool", "{}", 1s);
          session->close("test done");
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::UNIMPLEMENTED);
    CATCH_REQUIRE(result.error().error_message() == "unknown tool: no_such_tool");
  }

  CATCH_SECTION("handler-errors-are-returned") {
    auto [session, server] = connect(io_context, [](shared_ptr<RpcServer> server) {
      server->register_handler("fail", [](const std::string&) -> expected<std::string, Status> {
        return make_unexpected(Status{StatusCode::INVALID_ARGUMENT, "bad arguments"});
      });
      server->register_handler("throw", [](const std::string&) -> expected<std::string, Status> {
        throw std::runtime_error("handler exploded");
      });
    });
    CallResult failed, thrown;
    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          co_await session->async_open();
          failed = co_await session->async_call("fail", "", 1s);
          thrown = co_await session->async_call("throw", "", 1s);
          session->close("test done");
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(!failed.has_value());
    CATCH_REQUIRE(failed.error() == Status{StatusCode::INVALID_ARGUMENT, "bad arguments"});
    CATCH_REQUIRE(!thrown.has_value());
    CATCH_REQUIRE(thrown.error().error_code() == StatusCode::INTERNAL);
  }

  CATCH_SECTION("deadline-exceeded-when-worker-is-silent") {
    auto pair = make_pipe_pair(io_context.get_executor(), io_context.get_executor());
    CATCH_REQUIRE(pair.has_value());
    boost::asio::co_spawn(io_context, toolbridge::test::serve_silently(pair->second),
                          boost::asio::detached);
    auto session = make_shared<RpcSession>(pair->first);

    CallResult opened, result;
    std::size_t outstanding_after = 1;
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::steady_clock::duration{};
    boost::asio::co_spawn(
        io_context,
        [&]() -> awaitable<void> {
          opened = co_await session->async_open();
          result = co_await session->async_call("anything", "{}", 50ms);
          elapsed = std::chrono::steady_clock::now() - started;
          outstanding_after = session->outstanding_calls();
          session->close("test done");
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(opened.has_value());
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(elapsed >= 50ms);
    CATCH_REQUIRE(outstanding_after == 0);
  }

  CATCH_SECTION("server-close-fails-calls-and-ends-feed") {
    auto [session, server] = connect(io_context, [](shared_ptr<RpcServer> server) {
      std::weak_ptr<RpcServer> weak = server;
      server->register_handler("crash", [weak](const std::string&) -> expected<std::string, Status> {
        if (auto server = weak.lock())
          server->close();
        return "never delivered";
      });
    });
    CallResult result, after_close;
    std::optional<Notification> notification{Notification{}};
    boost::asio::co_spawn(
        io_context,
        [&, session = session]() -> awaitable<void> {
          co_await session->async_open();
          result = co_await session->async_call("crash", "", 0ms);
          notification = co_await session->async_next_notification();
          after_close = co_await session->async_call("crash", "", 1s);
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(!notification.has_value());
    CATCH_REQUIRE(!after_close.has_value());
    CATCH_REQUIRE(after_close.error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(session->is_closed());
  }

  CATCH_SECTION("notifications-arrive-in-order") {
    auto [session, server] = connect(io_context, [](shared_ptr<RpcServer> server) {
      std::weak_ptr<RpcServer> weak = server;
      server->register_handler("burst", [weak](const std::string&) -> expected<std::string, Status> {
        auto server = weak.lock();
        for (int i = 0; server && i < 5; ++i)
          server->notify(format("note-{}", i));
        return "sent";
      });
    });
    std::vector<std::string> payloads;
    CallResult result;
    boost::asio::co_spawn(
        io_context,
        [&, session = session, server = server]() -> awaitable<void> {
          co_await session->async_open();
          result = co_await session->async_call("burst", "", 1s);
          server->close(); // feed ends after the buffered notifications
          while (auto notification = co_await session->async_next_notification())
            payloads.push_back(notification->payload);
        },
        boost::asio::detached);
    io_context.run();

    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(payloads == std::vector<std::string>{"note-0", "note-1", "note-2", "note-3",
                                                       "note-4"});
  }
}

} // namespace toolbridge::net::test
