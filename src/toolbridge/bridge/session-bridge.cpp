#include "session-bridge.hpp"

#include "toolbridge/net/co-spawn.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>

namespace toolbridge::bridge {

using namespace std::chrono;

SessionBridge::SessionBridge(BridgeConfig config)
    : config_{std::move(config)}, relay_{config_.notification_capacity},
      supervisor_{context_.get_executor(), config_.transport_factory, config_.reconnect_delay,
                  config_.session} {
  supervisor_.set_on_connected(
      [this](shared_ptr<net::RpcSession> session) { on_connected_(std::move(session)); });
}

SessionBridge::~SessionBridge() { stop(); }

// ------------------------------------------------------------------------------------ start / stop

void SessionBridge::start() {
  std::lock_guard lock{padlock_};
  if (is_started_ || is_stopped_)
    return;
  is_started_ = true;
  context_.run();
  boost::asio::post(context_.get_executor(), [this]() { supervisor_.start(); });
}

void SessionBridge::stop() {
  bool was_started = false;
  {
    // Once stopped, `start` no longer touches the context
    std::lock_guard lock{padlock_};
    if (is_stopped_)
      return;
    is_stopped_ = true;
    was_started = is_started_;
  }
  boost::asio::post(context_.get_executor(), [this]() { supervisor_.stop(); });
  if (!was_started) // run the posted stop here
    context_.io_context().run();
  context_.stop();
  relay_.queue().close();
}

void SessionBridge::on_connected_(shared_ptr<net::RpcSession> session) {
  {
    std::lock_guard lock{padlock_};
    server_info_ = session->server_info();
  }
  boost::asio::co_spawn(context_.get_executor(), relay_.drain(std::move(session)),
                        [](std::exception_ptr ex_ptr, std::size_t) {
                          net::log_on_exception("notification relay")(ex_ptr);
                        });
}

std::string SessionBridge::server_info() const {
  std::lock_guard lock{padlock_};
  return server_info_;
}

// ----------------------------------------------------------------------------------------- request

net::CallResult SessionBridge::request(std::string_view name, std::string args,
                                       std::optional<milliseconds> timeout) {
  const auto call_timeout = timeout.value_or(config_.default_timeout);
  if (call_timeout <= 0ms)
    return make_unexpected(
        net::Status{net::StatusCode::INVALID_ARGUMENT,
                    format("timeout must be positive, got {}ms", call_timeout.count())});
  const auto deadline = steady_clock::now() + call_timeout;

  const auto generation = supervisor_.generation();
  if (generation == 0)
    return make_unexpected(net::Status{net::StatusCode::NOT_READY,
                                       format("not connected ({})", str(supervisor_.state()))});

  // The promise is the only state shared with the background thread
  async::Promise<net::CallResult> promise;
  auto future = promise.get_future();
  boost::asio::co_spawn(
      context_.get_executor(),
      issue_call_(generation, std::string{name}, std::move(args), call_timeout, std::move(promise)),
      net::log_on_exception("bridge request"));

  if (future.wait_until(deadline) == std::future_status::timeout && future.try_cancel()) {
    LOG_DEBUG("request '{}' timed out after {}ms", name, call_timeout.count());
    return make_unexpected(
        net::Status{net::StatusCode::DEADLINE_EXCEEDED,
                    format("no response to '{}' after {}ms", name, call_timeout.count())});
  }

  try {
    return future.get();
  } catch (const std::future_error& e) {
    // The call was dropped without a result, e.g., the bridge stopped
    return make_unexpected(net::Status{net::StatusCode::CONNECTION_LOST, e.what()});
  }
}

boost::asio::awaitable<void> SessionBridge::issue_call_(uint64_t generation, std::string name,
                                                        std::string args, milliseconds timeout,
                                                        async::Promise<net::CallResult> promise) {
  auto session = supervisor_.session();
  if (session == nullptr || supervisor_.generation() != generation) {
    promise.set_value(net::CallResult{make_unexpected(
        net::Status{net::StatusCode::CONNECTION_LOST, "session was replaced"})});
    co_return;
  }

  auto result = co_await session->async_call(std::move(name), std::move(args), timeout);
  if (!promise.set_value(std::move(result)))
    LOG_DEBUG("discarding result of abandoned request");
}

} // namespace toolbridge::bridge
