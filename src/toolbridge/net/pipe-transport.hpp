#pragma once

#include "transport.hpp"

#include "stdinc.hpp"

#include <boost/asio/posix/stream_descriptor.hpp>

#include <deque>
#include <utility>

namespace toolbridge::net {

/**
 * @brief Framed transport over a pair of file descriptors (one read, one write).
 *
 * Each frame is a 4 byte big-endian length followed by the frame bytes.
 */
class PipeTransport : public Transport {
private:
  executor_type executor_;
  boost::asio::posix::stream_descriptor input_;
  boost::asio::posix::stream_descriptor output_;
  std::deque<BufferType> outbox_;
  bool is_writing_{false};
  bool is_closed_{false};

  void write_next_();

public:
  /**
   * @brief Takes ownership of `read_fd` and `write_fd`.
   */
  PipeTransport(executor_type executor, int read_fd, int write_fd);
  ~PipeTransport() override;

  executor_type get_executor() override { return executor_; }
  boost::asio::awaitable<std::error_code> async_read_frame(BufferType& frame) override;
  void send_frame(BufferType frame) override;
  void close() override;
  bool is_open() const override { return !is_closed_; }
};

/**
 * @brief Two transports connected back to back through a pair of pipes.
 *        `first` runs on `executor_a`, and `second` on `executor_b`.
 */
expected<std::pair<shared_ptr<Transport>, shared_ptr<Transport>>, error_code>
make_pipe_pair(Transport::executor_type executor_a, Transport::executor_type executor_b);

/**
 * @brief A transport over this process's stdin and stdout, for worker processes.
 *
 * The process stdout is duplicated for the transport, and file descriptor 1 is then
 * pointed at /dev/null, so that stray writes to stdout cannot corrupt the frame stream.
 */
expected<shared_ptr<Transport>, error_code> open_stdio_transport(Transport::executor_type executor);

} // namespace toolbridge::net
