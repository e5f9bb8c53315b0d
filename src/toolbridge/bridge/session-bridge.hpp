#pragma once

#include "bridge-config.hpp"
#include "notification-relay.hpp"
#include "reconnect-supervisor.hpp"

#include "toolbridge/async/promise-future.hpp"
#include "toolbridge/net/asio-execution-context.hpp"

#include <chrono>
#include <mutex>
#include <optional>

namespace toolbridge::bridge {

/**
 * @brief Synchronous access to a worker process over a self-healing session.
 *
 * The bridge owns a background execution context (one thread), on which a
 * `ReconnectSupervisor` keeps an `RpcSession` connected, and a `NotificationRelay`
 * moves the session's notifications into `notifications()`.
 *
 * `request` may be called from any thread. It never blocks for longer than its
 * timeout, and fails immediately when no session is connected.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * BridgeConfig config;
 * config.transport_factory = [](auto executor) {
 *    return net::spawn_worker(executor, {"reminder-server", {}});
 * };
 * SessionBridge bridge{std::move(config)};
 * bridge.start();
 * auto result = bridge.request("list_reminders", "{}");
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class SessionBridge {
private:
  BridgeConfig config_;
  net::AsioExecutionContext context_; // destroyed after everything that runs on it
  NotificationRelay relay_;
  ReconnectSupervisor supervisor_;

  mutable std::mutex padlock_;
  std::string server_info_{};
  bool is_started_{false};
  bool is_stopped_{false};

  boost::asio::awaitable<void> issue_call_(uint64_t generation, std::string name,
                                           std::string args, std::chrono::milliseconds timeout,
                                           async::Promise<net::CallResult> promise);
  void on_connected_(shared_ptr<net::RpcSession> session);

public:
  explicit SessionBridge(BridgeConfig config);
  SessionBridge(const SessionBridge&) = delete;
  SessionBridge& operator=(const SessionBridge&) = delete;
  ~SessionBridge();

  /**
   * @brief Start the background thread, and begin connecting.
   */
  void start();

  /**
   * @brief Close the session, stop the supervisor, and join the background thread.
   *        Pending and later requests fail. Called by the destructor.
   */
  void stop();

  /**
   * @brief True while a session is connected.
   */
  bool is_ready() const { return supervisor_.is_ready(); }

  /**
   * @brief Call the tool `name` with `args`, blocking the calling thread until the
   *        result arrives, or `timeout` (default `config.default_timeout`) elapses.
   * @return The result payload, or one of: `INVALID_ARGUMENT` (timeout not positive),
   *         `NOT_READY` (no session), `DEADLINE_EXCEEDED` (timeout), `CONNECTION_LOST`
   *         (session lost, or replaced), or the worker's error status.
   */
  net::CallResult request(std::string_view name, std::string args,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  NotificationQueue& notifications() { return relay_.queue(); }

  ReconnectSupervisor::State state() const { return supervisor_.state(); }
  const ReconnectSupervisor& supervisor() const { return supervisor_; }
  const BridgeConfig& config() const { return config_; }

  /**
   * @brief The handshake reply of the most recently connected session.
   */
  std::string server_info() const;
};

} // namespace toolbridge::bridge
