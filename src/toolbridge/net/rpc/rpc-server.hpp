#pragma once

#include "envelope.hpp"
#include "status.hpp"

#include "toolbridge/net/transport.hpp"

#include "stdinc.hpp"

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <map>
#include <memory>

namespace toolbridge::net {

/**
 * @brief Handles one call: receives the request payload, and returns the response
 *        payload or an error status. Runs on the server's executor.
 */
using CallHandler = std::function<expected<std::string, Status>(const std::string& payload)>;

/**
 * @brief The worker end of the protocol: serves requests, and pushes notifications.
 *
 * Requests are handled one at a time, in arrival order, on the transport's executor.
 * The handshake request is answered with `server_info`.
 */
class RpcServer : public std::enable_shared_from_this<RpcServer> {
private:
  shared_ptr<Transport> transport_;
  std::string server_info_;
  std::map<std::string, CallHandler, std::less<>> handlers_;
  uint64_t requests_served_{0};

  void handle_request_(const detail::RequestEnvelopeHeader& header);
  void finish_call_(uint64_t request_id, std::chrono::steady_clock::time_point deadline,
                    const expected<std::string, Status>& result);

public:
  RpcServer(shared_ptr<Transport> transport, std::string server_info);

  /**
   * @brief Register the handler for `method`. Must be called before `run`.
   */
  void register_handler(std::string method, CallHandler handler);

  /**
   * @brief Serve requests until the transport closes.
   * @return The error that ended the stream; `ecode::stream_closed` when the
   *         client hung up cleanly.
   */
  boost::asio::awaitable<std::error_code> run();

  /**
   * @brief Push a notification to the client.
   * @return false iff the transport is closed, and the notification was discarded.
   */
  bool notify(std::string_view payload);

  void close();
  bool is_open() const { return transport_->is_open(); }
  uint64_t requests_served() const { return requests_served_; }
};

} // namespace toolbridge::net
