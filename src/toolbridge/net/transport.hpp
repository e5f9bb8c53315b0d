#pragma once

#include "buffer.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <system_error>

namespace toolbridge::net {

/**
 * @brief Frames larger than this are rejected with `ecode::object_too_large`.
 */
constexpr uint32_t k_max_frame_size = 16 * 1024 * 1024;

/**
 * @brief A duplex stream of length-prefixed frames to a worker process.
 *
 * All methods must be called on the transport's executor.
 * A write failure closes the transport, which in turn fails the pending read.
 */
class Transport : public std::enable_shared_from_this<Transport> {
public:
  using executor_type = boost::asio::any_io_executor;

  virtual ~Transport() = default;

  virtual executor_type get_executor() = 0;

  /**
   * @brief Read the next frame into `frame`.
   * @return `ecode::stream_closed` at a clean end of stream, `ecode::premature_eof`
   *         if the stream ends mid-frame, or the underlying i/o error.
   */
  virtual boost::asio::awaitable<std::error_code> async_read_frame(BufferType& frame) = 0;

  /**
   * @brief Queue `frame` for writing. Frames are written in the order queued.
   */
  virtual void send_frame(BufferType frame) = 0;

  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

} // namespace toolbridge::net
