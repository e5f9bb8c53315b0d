#include "rpc-session.hpp"

#include "toolbridge/net/co-spawn.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <limits>

namespace toolbridge::net {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

const char* str(RpcSession::State state) {
  switch (state) {
  case RpcSession::State::DISCONNECTED: return "DISCONNECTED";
  case RpcSession::State::CONNECTING: return "CONNECTING";
  case RpcSession::State::READY: return "READY";
  case RpcSession::State::FAILED: return "FAILED";
  }
  return "<unknown>";
}

// ------------------------------------------------------------------------------------ construction

RpcSession::RpcSession(shared_ptr<Transport> transport, SessionConfig config)
    : transport_{std::move(transport)}, config_{std::move(config)},
      feed_signal_{transport_->get_executor()}, closed_signal_{transport_->get_executor()} {
  feed_signal_.expires_at(boost::asio::steady_timer::time_point::max());
  closed_signal_.expires_at(boost::asio::steady_timer::time_point::max());
}

RpcSession::~RpcSession() {
  if (transport_->is_open())
    transport_->close();
}

// -------------------------------------------------------------------------------------- async_open

awaitable<CallResult> RpcSession::async_open() {
  auto self = shared_from_this();

  if (state() != State::DISCONNECTED)
    co_return make_unexpected(Status{StatusCode::FAILED_PRECONDITION, "session already opened"});
  state_.store(State::CONNECTING, std::memory_order_release);

  boost::asio::co_spawn(get_executor(), read_loop_(self), log_on_exception("rpc-session read"));

  auto result = co_await call_(detail::k_initialize_method, config_.client_name,
                               config_.handshake_timeout);
  if (!result.has_value()) {
    close(format("handshake failed: {}", result.error().to_string()));
    co_return result;
  }

  if (state() != State::CONNECTING) // closed while waiting
    co_return make_unexpected(Status{StatusCode::CONNECTION_LOST, close_reason_});

  server_info_ = *result;
  state_.store(State::READY, std::memory_order_release);
  co_return result;
}

// -------------------------------------------------------------------------------------- async_call

awaitable<CallResult> RpcSession::async_call(std::string method, std::string payload,
                                             std::chrono::milliseconds deadline) {
  auto self = shared_from_this();
  if (!is_open())
    co_return make_unexpected(Status{StatusCode::CONNECTION_LOST, "session is not open"});
  co_return co_await call_(method, payload, deadline);
}

awaitable<CallResult> RpcSession::call_(std::string_view method, std::string_view payload,
                                        std::chrono::milliseconds deadline) {
  if (is_closed())
    co_return make_unexpected(Status{StatusCode::CONNECTION_LOST, close_reason_});

  const auto request_id = next_request_id_++;
  const auto max_millis = std::chrono::milliseconds{std::numeric_limits<uint32_t>::max()};
  const auto deadline_millis =
      (deadline.count() <= 0) ? uint32_t(0) : uint32_t(std::min(deadline, max_millis).count());

  BufferType buffer;
  if (!detail::encode_request(buffer, request_id, deadline_millis, method, payload))
    co_return make_unexpected(Status{StatusCode::INVALID_ARGUMENT, "failed to encode request"});

  auto pending = make_shared<PendingCall>(get_executor());
  if (deadline_millis == 0)
    pending->timer.expires_at(boost::asio::steady_timer::time_point::max());
  else
    pending->timer.expires_after(std::chrono::milliseconds{deadline_millis});

  outstanding_calls_.insert({request_id, pending});
  transport_->send_frame(std::move(buffer));
  TRACE("sent request {} '{}', deadline {}ms", request_id, method, deadline_millis);

  if (!pending->result.has_value()) {
    boost::system::error_code ec;
    co_await pending->timer.async_wait(redirect_error(use_awaitable, ec));
  }

  if (pending->result.has_value())
    co_return std::move(*pending->result);

  // The deadline passed: forget the call, so that a late response is discarded
  outstanding_calls_.erase(request_id);
  co_return make_unexpected(
      Status{StatusCode::DEADLINE_EXCEEDED, format("no response to '{}' after {}ms", method,
                                                   deadline_millis)});
}

// ------------------------------------------------------------------------- async_next_notification

awaitable<std::optional<Notification>> RpcSession::async_next_notification() {
  auto self = shared_from_this();
  while (feed_.empty() && !is_closed()) {
    boost::system::error_code ec;
    co_await feed_signal_.async_wait(redirect_error(use_awaitable, ec));
  }
  if (feed_.empty())
    co_return std::nullopt;
  auto notification = std::move(feed_.front());
  feed_.pop_front();
  co_return notification;
}

awaitable<void> RpcSession::async_wait_closed() {
  auto self = shared_from_this();
  while (!is_closed()) {
    boost::system::error_code ec;
    co_await closed_signal_.async_wait(redirect_error(use_awaitable, ec));
  }
}

// ------------------------------------------------------------------------------------------- close

void RpcSession::close(std::string_view reason) {
  if (is_closed())
    return;
  state_.store(State::FAILED, std::memory_order_release);
  close_reason_ = std::string{reason};
  INFO("session closed: {}", reason);

  auto calls = std::move(outstanding_calls_);
  outstanding_calls_.clear();
  for (auto& [request_id, pending] : calls) {
    pending->result = make_unexpected(Status{StatusCode::CONNECTION_LOST, close_reason_});
    pending->timer.cancel();
  }

  feed_signal_.cancel();
  closed_signal_.cancel();
  transport_->close();
}

// -------------------------------------------------------------------------------------- read loop

awaitable<void> RpcSession::read_loop_(shared_ptr<RpcSession> self) {
  BufferType frame;
  while (!self->is_closed()) {
    const auto ec = co_await self->transport_->async_read_frame(frame);
    if (ec) {
      self->close(ec.message());
      break;
    }
    self->dispatch_frame_(to_span_bytes(frame));
  }
}

void RpcSession::dispatch_frame_(std::span<const std::byte> frame) {
  const auto kind = detail::peek_kind(frame);
  if (!kind.has_value()) {
    LOG_ERR("dropping frame of {} bytes with unknown envelope kind", frame.size());
    return;
  }

  switch (*kind) {
  case detail::EnvelopeKind::RESPONSE: {
    detail::ResponseEnvelopeHeader header;
    if (!detail::decode(header, frame)) {
      LOG_ERR("dropping undecodable response of {} bytes", frame.size());
      return;
    }
    finish_response_(header);
  } break;

  case detail::EnvelopeKind::NOTIFICATION: {
    detail::NotificationEnvelopeHeader header;
    if (!detail::decode(header, frame))
      return;
    feed_.push_back(
        Notification{std::chrono::system_clock::now(), std::string{to_string_view(header.payload)}});
    feed_signal_.cancel();
  } break;

  case detail::EnvelopeKind::REQUEST: {
    detail::RequestEnvelopeHeader header;
    if (!detail::decode(header, frame)) {
      LOG_ERR("dropping undecodable request of {} bytes", frame.size());
      return;
    }
    reject_request_(header);
  } break;
  }
}

void RpcSession::finish_response_(detail::ResponseEnvelopeHeader& header) {
  auto ii = outstanding_calls_.find(header.request_id);
  if (ii == cend(outstanding_calls_)) {
    LOG_DEBUG("discarding late response to request {}", header.request_id);
    return;
  }

  auto pending = std::move(ii->second);
  outstanding_calls_.erase(ii);

  if (header.status.ok())
    pending->result = std::string{to_string_view(header.payload)};
  else
    pending->result = make_unexpected(std::move(header.status));
  pending->timer.cancel();
}

void RpcSession::reject_request_(const detail::RequestEnvelopeHeader& header) {
  WARN("worker sent request '{}'; clients do not serve requests", header.method);
  BufferType buffer;
  if (detail::encode_response(buffer, header.request_id,
                              Status{StatusCode::UNIMPLEMENTED, "client does not serve requests"},
                              {}))
    transport_->send_frame(std::move(buffer));
}

} // namespace toolbridge::net
