#pragma once

#include "bridge-config.hpp"

#include "toolbridge/net/rpc/rpc-session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cstdint>
#include <functional>

namespace toolbridge::bridge {

/**
 * @brief Keeps one `RpcSession` connected, forever.
 *
 * Runs as a coroutine on the bridge's executor:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~
 * IDLE -> CONNECTING -> CONNECTED -> BACKOFF -> CONNECTING -> ...
 *              \_______________________^
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Any failure to create a transport, open the session, or any later loss of the
 * session, leads to BACKOFF: a timer wait of `reconnect_delay`, after which a new
 * attempt is made unconditionally. There is no retry limit.
 *
 * `state()`, `generation()`, `attempts()` and `connections()` may be read from any
 * thread. Everything else must be called on the executor.
 */
class ReconnectSupervisor {
public:
  enum class State : int8_t { IDLE, CONNECTING, CONNECTED, BACKOFF };

  /**
   * @brief Called on the executor each time a session completes its handshake.
   */
  using ConnectedHandler = std::function<void(shared_ptr<net::RpcSession> session)>;

private:
  net::Transport::executor_type executor_;
  TransportFactory transport_factory_;
  std::chrono::milliseconds reconnect_delay_;
  net::SessionConfig session_config_;
  ConnectedHandler on_connected_{};

  boost::asio::steady_timer backoff_timer_;
  shared_ptr<net::RpcSession> session_{};
  bool is_started_{false};
  bool is_stopping_{false};

  std::atomic<State> state_{State::IDLE};
  std::atomic<uint64_t> generation_{0}; //!< 0 when not connected
  uint64_t last_generation_{0};
  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> connections_{0};

  boost::asio::awaitable<void> run_();
  boost::asio::awaitable<void> connect_once_();
  void set_state_(State state);

public:
  ReconnectSupervisor(net::Transport::executor_type executor, TransportFactory transport_factory,
                      std::chrono::milliseconds reconnect_delay,
                      net::SessionConfig session_config = {});
  ReconnectSupervisor(const ReconnectSupervisor&) = delete;
  ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

  void set_on_connected(ConnectedHandler handler) { on_connected_ = std::move(handler); }

  /**
   * @brief Spawn the supervisor coroutine. Does nothing if already started.
   */
  void start();

  /**
   * @brief Close the current session and end the supervisor coroutine.
   */
  void stop();

  /**
   * @brief The current session, if `CONNECTED`; otherwise nullptr.
   */
  shared_ptr<net::RpcSession> session() const;

  State state() const { return state_.load(std::memory_order_acquire); }
  bool is_ready() const { return generation() != 0; }

  /**
   * @brief Identifies the current session; changes with every new connection.
   *        0 when there is no connected session.
   */
  uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

  uint64_t attempts() const { return attempts_.load(std::memory_order_acquire); }
  uint64_t connections() const { return connections_.load(std::memory_order_acquire); }
};

const char* str(ReconnectSupervisor::State state);

} // namespace toolbridge::bridge
