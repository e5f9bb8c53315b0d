#include "reconnect-supervisor.hpp"

#include "toolbridge/net/co-spawn.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolbridge::bridge {

using boost::asio::awaitable;

const char* str(ReconnectSupervisor::State state) {
  switch (state) {
  case ReconnectSupervisor::State::IDLE: return "IDLE";
  case ReconnectSupervisor::State::CONNECTING: return "CONNECTING";
  case ReconnectSupervisor::State::CONNECTED: return "CONNECTED";
  case ReconnectSupervisor::State::BACKOFF: return "BACKOFF";
  }
  return "<unknown>";
}

ReconnectSupervisor::ReconnectSupervisor(net::Transport::executor_type executor,
                                         TransportFactory transport_factory,
                                         std::chrono::milliseconds reconnect_delay,
                                         net::SessionConfig session_config)
    : executor_{executor}, transport_factory_{std::move(transport_factory)},
      reconnect_delay_{reconnect_delay}, session_config_{std::move(session_config)},
      backoff_timer_{executor} {}

void ReconnectSupervisor::start() {
  if (is_started_)
    return;
  is_started_ = true;
  boost::asio::co_spawn(executor_, run_(), net::log_on_exception("reconnect-supervisor"));
}

void ReconnectSupervisor::stop() {
  if (is_stopping_)
    return;
  is_stopping_ = true;
  backoff_timer_.cancel();
  if (session_ != nullptr)
    session_->close("bridge stopped");
}

shared_ptr<net::RpcSession> ReconnectSupervisor::session() const {
  return (state() == State::CONNECTED) ? session_ : nullptr;
}

void ReconnectSupervisor::set_state_(State state) {
  const auto old_state = state_.exchange(state, std::memory_order_acq_rel);
  if (old_state != state)
    INFO("supervisor: {} -> {}", str(old_state), str(state));
}

// -------------------------------------------------------------------------------------------- run_

awaitable<void> ReconnectSupervisor::run_() {
  while (!is_stopping_) {
    co_await connect_once_();

    generation_.store(0, std::memory_order_release);
    session_.reset();
    if (is_stopping_)
      break;

    set_state_(State::BACKOFF);
    backoff_timer_.expires_after(reconnect_delay_);
    boost::system::error_code ec;
    co_await backoff_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }
  set_state_(State::IDLE);
}

awaitable<void> ReconnectSupervisor::connect_once_() {
  set_state_(State::CONNECTING);
  attempts_.fetch_add(1, std::memory_order_acq_rel);

  if (!transport_factory_) {
    LOG_ERR("supervisor has no transport factory");
    co_return;
  }

  expected<shared_ptr<net::Transport>, error_code> transport;
  try {
    transport = transport_factory_(executor_);
  } catch (const std::exception& e) {
    WARN("transport factory threw: {}", e.what());
    co_return;
  }
  if (!transport.has_value()) {
    WARN("failed to create transport: {}", transport.error().message());
    co_return;
  }

  session_ = make_shared<net::RpcSession>(std::move(*transport), session_config_);
  auto session = session_;

  const auto result = co_await session->async_open();
  if (!result.has_value()) {
    WARN("failed to open session: {}", result.error().to_string());
    co_return;
  }
  if (is_stopping_)
    co_return;

  connections_.fetch_add(1, std::memory_order_acq_rel);
  generation_.store(++last_generation_, std::memory_order_release);
  set_state_(State::CONNECTED);
  if (on_connected_)
    on_connected_(session);

  co_await session->async_wait_closed();
  WARN("session lost: {}", session->close_reason());
}

} // namespace toolbridge::bridge
