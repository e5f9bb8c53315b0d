#pragma once

#include "toolbridge/net/rpc/rpc-session.hpp"
#include "toolbridge/net/transport.hpp"

#include <chrono>
#include <functional>

namespace toolbridge::bridge {

/**
 * @brief Creates a fresh transport to the worker, on the bridge's executor.
 *        Called once per connection attempt.
 */
using TransportFactory = std::function<expected<shared_ptr<net::Transport>, error_code>(
    net::Transport::executor_type executor)>;

struct BridgeConfig {
  TransportFactory transport_factory{};
  std::chrono::milliseconds reconnect_delay{5'000};  //!< Fixed delay between attempts
  std::chrono::milliseconds default_timeout{10'000}; //!< For `request` without a timeout
  std::size_t notification_capacity{0};              //!< 0 means unbounded
  net::SessionConfig session{};                      //!< Handshake timeout, client name
};

} // namespace toolbridge::bridge
