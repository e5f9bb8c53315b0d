#pragma once

#include "toolbridge/async/blocking-queue.hpp"
#include "toolbridge/net/rpc/rpc-session.hpp"

#include <boost/asio/awaitable.hpp>

namespace toolbridge::bridge {

using NotificationQueue = async::BlockingQueue<net::Notification>;

/**
 * @brief Moves notifications from the session (on the executor) into a thread-safe
 *        queue (for the caller's threads), preserving arrival order.
 */
class NotificationRelay {
private:
  NotificationQueue queue_;

public:
  explicit NotificationRelay(std::size_t capacity = 0) : queue_{capacity} {}

  NotificationQueue& queue() { return queue_; }
  const NotificationQueue& queue() const { return queue_; }

  /**
   * @brief Relay notifications from `session` until its feed ends. Runs on the
   *        session's executor; spawned once per connected session.
   * @return The number of notifications relayed.
   */
  boost::asio::awaitable<std::size_t> drain(shared_ptr<net::RpcSession> session);
};

} // namespace toolbridge::bridge
