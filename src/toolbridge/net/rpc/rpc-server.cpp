#include "rpc-server.hpp"

namespace toolbridge::net {

RpcServer::RpcServer(shared_ptr<Transport> transport, std::string server_info)
    : transport_{std::move(transport)}, server_info_{std::move(server_info)} {}

void RpcServer::register_handler(std::string method, CallHandler handler) {
  Expects(method != detail::k_initialize_method);
  handlers_[std::move(method)] = std::move(handler);
}

// --------------------------------------------------------------------------------------------- run

boost::asio::awaitable<error_code> RpcServer::run() {
  auto self = shared_from_this();
  BufferType frame;
  while (true) {
    const auto ec = co_await transport_->async_read_frame(frame);
    if (ec) {
      INFO("rpc server stopping: {}", ec.message());
      transport_->close();
      co_return ec;
    }

    const auto payload = to_span_bytes(frame);
    const auto kind = detail::peek_kind(payload);
    if (kind != detail::EnvelopeKind::REQUEST) {
      LOG_ERR("server dropping frame of {} bytes that is not a request", frame.size());
      continue;
    }

    detail::RequestEnvelopeHeader header;
    if (!detail::decode(header, payload)) {
      LOG_ERR("server dropping undecodable request of {} bytes", frame.size());
      continue;
    }
    handle_request_(header);
  }
}

// ---------------------------------------------------------------------------------- handle_request

void RpcServer::handle_request_(const detail::RequestEnvelopeHeader& header) {
  // Calculate the deadline
  const auto millis = std::chrono::milliseconds{header.deadline_millis};
  const auto deadline = (millis.count() != 0) ? std::chrono::steady_clock::now() + millis
                                              : std::chrono::steady_clock::time_point::max();

  ++requests_served_;
  TRACE("request {} '{}'", header.request_id, header.method);

  if (header.method == detail::k_initialize_method) {
    INFO("handshake from '{}'", to_string_view(header.payload));
    finish_call_(header.request_id, deadline, server_info_);
    return;
  }

  auto ii = handlers_.find(header.method);
  if (ii == cend(handlers_)) {
    finish_call_(header.request_id, deadline,
                 make_unexpected(Status{StatusCode::UNIMPLEMENTED,
                                        format("unknown tool: {}", header.method)}));
    return;
  }

  expected<std::string, Status> result;
  try {
    result = ii->second(std::string{to_string_view(header.payload)});
  } catch (const std::exception& e) {
    LOG_ERR("handler for '{}' threw: {}", header.method, e.what());
    result = make_unexpected(Status{StatusCode::INTERNAL, e.what()});
  }
  finish_call_(header.request_id, deadline, result);
}

void RpcServer::finish_call_(uint64_t request_id, std::chrono::steady_clock::time_point deadline,
                             const expected<std::string, Status>& result) {
  BufferType buffer;
  buffer.reserve(512);

  auto send_error = [this, &buffer, request_id](Status status) {
    buffer.clear();
    if (detail::encode_response(buffer, request_id, status, {}))
      transport_->send_frame(std::move(buffer));
  };

  const auto deadline_exceeded = deadline < std::chrono::steady_clock::now();
  if (deadline_exceeded) {
    send_error(Status{StatusCode::DEADLINE_EXCEEDED});
    return;
  }

  const bool encoded = result.has_value()
                           ? detail::encode_response(buffer, request_id, Status{}, *result)
                           : detail::encode_response(buffer, request_id, result.error(), {});
  if (!encoded) {
    send_error(Status{StatusCode::DATA_LOSS, "failed to encode response"});
    return;
  }
  transport_->send_frame(std::move(buffer));
}

// ------------------------------------------------------------------------------------------ notify

bool RpcServer::notify(std::string_view payload) {
  if (!transport_->is_open())
    return false;
  BufferType buffer;
  if (!detail::encode_notification(buffer, payload))
    return false;
  transport_->send_frame(std::move(buffer));
  return true;
}

void RpcServer::close() { transport_->close(); }

} // namespace toolbridge::net
