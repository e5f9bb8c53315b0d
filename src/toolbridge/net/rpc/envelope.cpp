#include "envelope.hpp"

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <limits>

namespace toolbridge::net::detail {

// ---------------------------------------------------------------------------------------- Encoders

namespace {
  /// Writes sequentially into a buffer that has already been sized
  class Encoder {
  private:
    BufferType& buffer_;
    std::size_t offset_{0};

  public:
    explicit Encoder(BufferType& buffer) : buffer_{buffer} {}

    std::size_t offset() const { return offset_; }

    template <typename T> void integer(T value) {
      boost::endian::native_to_big_inplace(value);
      std::memcpy(&buffer_[offset_], &value, sizeof(T));
      offset_ += sizeof(T);
    }

    void bytes(std::string_view data) {
      if (data.size() > 0)
        std::memcpy(&buffer_[offset_], data.data(), data.size());
      offset_ += data.size();
    }

    void string(std::string_view data) {
      integer(uint32_t(data.size()));
      bytes(data);
    }
  };

  class Decoder {
  private:
    std::span<const std::byte> data_;

  public:
    explicit Decoder(std::span<const std::byte> data) : data_{data} {}

    std::span<const std::byte> remaining() const { return data_; }

    template <typename T> bool integer(T& value) {
      if (data_.size() < sizeof(T))
        return false;
      std::memcpy(&value, data_.data(), sizeof(T));
      boost::endian::big_to_native_inplace(value);
      data_ = data_.subspan(sizeof(T));
      return true;
    }

    bool string(std::string& value) {
      uint32_t length = 0;
      if (!integer(length) || data_.size() < length)
        return false;
      value.assign(reinterpret_cast<const char*>(data_.data()), length);
      data_ = data_.subspan(length);
      return true;
    }
  };

  bool fits_u32(std::string_view s) { return s.size() <= std::numeric_limits<uint32_t>::max(); }

} // namespace

std::optional<EnvelopeKind> peek_kind(std::span<const std::byte> payload) {
  if (payload.empty())
    return std::nullopt;
  const auto kind = std::to_integer<uint8_t>(payload[0]);
  if (kind > uint8_t(EnvelopeKind::NOTIFICATION))
    return std::nullopt;
  return EnvelopeKind(kind);
}

// ----------------------------------------------------------------------------------------- Request

static constexpr std::size_t k_request_header_size = 1 + 8 + 4 + 4;

bool encode_request(BufferType& buffer, uint64_t request_id, uint32_t deadline_millis,
                    std::string_view method, std::string_view payload) {
  if (!fits_u32(method))
    return false;

  buffer.resize(k_request_header_size + method.size() + payload.size());
  Encoder encoder{buffer};
  encoder.integer(uint8_t(EnvelopeKind::REQUEST));
  encoder.integer(request_id);
  encoder.integer(deadline_millis);
  encoder.string(method);
  encoder.bytes(payload);
  return encoder.offset() == buffer.size();
}

bool decode(RequestEnvelopeHeader& header, std::span<const std::byte> payload) {
  Decoder decoder{payload};
  uint8_t kind = 0;
  if (!decoder.integer(kind) ||                   // If any decode
      !decoder.integer(header.request_id) ||      // operation
      !decoder.integer(header.deadline_millis) || // fails
      !decoder.string(header.method))             // then
    return false;                                 // return false
  if (kind != uint8_t(EnvelopeKind::REQUEST))
    return false;
  header.payload = decoder.remaining();
  return true;
}

// ---------------------------------------------------------------------------------------- Response

static constexpr std::size_t k_min_response_header_size = 1 + 8 + 1 + 4 + 4;

bool encode_response(BufferType& buffer, uint64_t request_id, const Status& status,
                     std::string_view payload) {
  if (!fits_u32(status.error_message()) || !fits_u32(status.error_details()))
    return false;

  buffer.resize(k_min_response_header_size + status.error_message().size() +
                status.error_details().size() + payload.size());
  Encoder encoder{buffer};
  encoder.integer(uint8_t(EnvelopeKind::RESPONSE));
  encoder.integer(request_id);
  encoder.integer(int8_t(status.error_code()));
  encoder.string(status.error_message());
  encoder.string(status.error_details());
  encoder.bytes(payload);
  return encoder.offset() == buffer.size();
}

bool decode(ResponseEnvelopeHeader& header, std::span<const std::byte> payload) {
  Decoder decoder{payload};
  uint8_t kind = 0;
  int8_t error_code = 0;
  std::string error_message{};
  std::string error_details{};
  if (!decoder.integer(kind) ||              // If any
      !decoder.integer(header.request_id) || // decode
      !decoder.integer(error_code) ||        // operation
      !decoder.string(error_message) ||      // fails
      !decoder.string(error_details))        // then
    return false;                            // return false
  if (kind != uint8_t(EnvelopeKind::RESPONSE))
    return false;
  if (error_code < 0 || error_code >= int8_t(StatusCode::DO_NOT_USE))
    return false;

  header.status =
      Status{StatusCode(error_code), std::move(error_message), std::move(error_details)};
  header.payload = decoder.remaining();
  return true;
}

// ------------------------------------------------------------------------------------ Notification

bool encode_notification(BufferType& buffer, std::string_view payload) {
  buffer.resize(1 + payload.size());
  Encoder encoder{buffer};
  encoder.integer(uint8_t(EnvelopeKind::NOTIFICATION));
  encoder.bytes(payload);
  return encoder.offset() == buffer.size();
}

bool decode(NotificationEnvelopeHeader& header, std::span<const std::byte> payload) {
  if (peek_kind(payload) != EnvelopeKind::NOTIFICATION)
    return false;
  header.payload = payload.subspan(1);
  return true;
}

} // namespace toolbridge::net::detail
