#pragma once

#include "envelope.hpp"
#include "status.hpp"

#include "toolbridge/net/transport.hpp"

#include "stdinc.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <unordered_map>

namespace toolbridge::net {

/**
 * @brief A push message from the worker, stamped on arrival.
 */
struct Notification {
  std::chrono::system_clock::time_point timestamp{};
  std::string payload{};
};

using CallResult = expected<std::string, Status>;

struct SessionConfig {
  std::string client_name{"toolbridge"};                      //!< Sent with the handshake
  std::chrono::milliseconds handshake_timeout{10'000};        //!< For `async_open`
};

/**
 * @brief The client end of a request/response/notification protocol over a `Transport`.
 *
 * Calls are multiplexed: each request carries a fresh request id, and responses are
 * matched by id, so any number of calls may be outstanding. Notifications are queued
 * as they arrive, and consumed with `async_next_notification`.
 *
 * A session is opened once. A read or write failure closes it for good: every
 * outstanding call fails with `CONNECTION_LOST` and the notification feed ends.
 *
 * All methods must be called on the transport's executor.
 */
class RpcSession : public std::enable_shared_from_this<RpcSession> {
public:
  enum class State : int8_t { DISCONNECTED, CONNECTING, READY, FAILED };

private:
  struct PendingCall {
    explicit PendingCall(Transport::executor_type executor) : timer{executor} {}
    boost::asio::steady_timer timer; //!< Expires at the deadline; cancelled on response
    std::optional<CallResult> result{};
  };

  shared_ptr<Transport> transport_;
  SessionConfig config_;
  std::atomic<State> state_{State::DISCONNECTED};
  std::string server_info_{};
  std::string close_reason_{};

  uint64_t next_request_id_{1};
  std::unordered_map<uint64_t, shared_ptr<PendingCall>> outstanding_calls_;

  std::deque<Notification> feed_;
  boost::asio::steady_timer feed_signal_;   //!< Never expires; cancelled to wake readers
  boost::asio::steady_timer closed_signal_; //!< Never expires; cancelled on close

  static boost::asio::awaitable<void> read_loop_(shared_ptr<RpcSession> self);

  boost::asio::awaitable<CallResult> call_(std::string_view method, std::string_view payload,
                                           std::chrono::milliseconds deadline);
  void dispatch_frame_(std::span<const std::byte> frame);
  void finish_response_(detail::ResponseEnvelopeHeader& header);
  void reject_request_(const detail::RequestEnvelopeHeader& header);

public:
  RpcSession(shared_ptr<Transport> transport, SessionConfig config = {});
  RpcSession(const RpcSession&) = delete;
  RpcSession& operator=(const RpcSession&) = delete;
  ~RpcSession();

  /**
   * @brief Start reading from the transport, and perform the handshake.
   * @return The worker's handshake reply, or the reason the handshake failed. On
   *         failure the session is closed.
   */
  boost::asio::awaitable<CallResult> async_open();

  /**
   * @brief Call `method` on the worker.
   * @param deadline Time allowed for the response; zero means no deadline.
   * @return The response payload, `DEADLINE_EXCEEDED` if the deadline passes first
   *         (a late response is then discarded), `CONNECTION_LOST` if the session
   *         closes first, or the error status the worker responded with.
   */
  boost::asio::awaitable<CallResult> async_call(std::string method, std::string payload,
                                                std::chrono::milliseconds deadline);

  /**
   * @brief The next notification, in arrival order.
   * @return `nullopt` once the session is closed and the feed is empty.
   */
  boost::asio::awaitable<std::optional<Notification>> async_next_notification();

  /**
   * @brief Resumes when the session closes.
   */
  boost::asio::awaitable<void> async_wait_closed();

  /**
   * @brief Close the transport, fail outstanding calls, and end the notification feed.
   */
  void close(std::string_view reason);

  State state() const { return state_.load(std::memory_order_acquire); }
  bool is_open() const { return state() == State::READY; }
  bool is_closed() const { return state() == State::FAILED; }

  /** @brief The handshake reply; empty until `async_open` succeeds */
  const std::string& server_info() const { return server_info_; }
  const std::string& close_reason() const { return close_reason_; }
  std::size_t outstanding_calls() const { return outstanding_calls_.size(); }
  Transport::executor_type get_executor() const { return transport_->get_executor(); }
};

const char* str(RpcSession::State state);

} // namespace toolbridge::net
