#include "notification-relay.hpp"

namespace toolbridge::bridge {

boost::asio::awaitable<std::size_t> NotificationRelay::drain(shared_ptr<net::RpcSession> session) {
  std::size_t counter = 0;
  while (auto notification = co_await session->async_next_notification()) {
    ++counter;
    if (!queue_.push(std::move(*notification)))
      WARN("notification queue full (capacity {}): dropped oldest, {} dropped in total",
           queue_.capacity(), queue_.dropped());
  }
  LOG_DEBUG("notification relay finished after {} notifications", counter);
  co_return counter;
}

} // namespace toolbridge::bridge
