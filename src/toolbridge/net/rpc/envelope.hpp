#pragma once

#include "status.hpp"

#include "toolbridge/net/buffer.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace toolbridge::net::detail {

/**
 * @brief Method name of the handshake request sent by `RpcSession::async_open`
 */
constexpr std::string_view k_initialize_method = "initialize";

/**
 * @brief The first byte of every envelope.
 */
enum class EnvelopeKind : uint8_t { RESPONSE = 0, REQUEST = 1, NOTIFICATION = 2 };

/**
 * @brief The kind of the envelope in `payload`, or `nullopt` if it's unrecognized.
 */
std::optional<EnvelopeKind> peek_kind(std::span<const std::byte> payload);

/**
 * @brief The header is sent in network byte order
 */
struct RequestEnvelopeHeader {
  uint64_t request_id{0};             //!< So the client can track responses
  uint32_t deadline_millis{0};        //!< Milliseconds to respond to call; 0 means no deadline
  std::string method{};               //!< The tool to call
  std::span<const std::byte> payload; //!< The call arguments
};

/**
 * @brief Encode a complete request envelope into `buffer`, replacing its contents.
 * @return false iff there's an error encoding the data
 */
bool encode_request(BufferType& buffer, uint64_t request_id, uint32_t deadline_millis,
                    std::string_view method, std::string_view payload);

bool decode(RequestEnvelopeHeader& header, std::span<const std::byte> payload);

struct ResponseEnvelopeHeader {
  uint64_t request_id{0};             //!< So the client can track responses
  Status status;                      //!< The response status from the server
  std::span<const std::byte> payload; //!< The call result
};

/**
 * @return false iff there's an error encoding the data
 */
bool encode_response(BufferType& buffer, uint64_t request_id, const Status& status,
                     std::string_view payload);

bool decode(ResponseEnvelopeHeader& header, std::span<const std::byte> payload);

struct NotificationEnvelopeHeader {
  std::span<const std::byte> payload;
};

bool encode_notification(BufferType& buffer, std::string_view payload);

bool decode(NotificationEnvelopeHeader& header, std::span<const std::byte> payload);

} // namespace toolbridge::net::detail
