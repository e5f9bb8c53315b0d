#include "pipe-transport.hpp"

#include "toolbridge/utils/error-codes.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>

#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <mutex>
#include <unistd.h>

namespace toolbridge::net {

namespace {
  /// Writing to a pipe whose reader has gone must be an error, not a signal
  void ignore_sigpipe() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
  }

  error_code last_system_error() { return error_code{errno, std::system_category()}; }
} // namespace

// ------------------------------------------------------------------------------------ construction

PipeTransport::PipeTransport(executor_type executor, int read_fd, int write_fd)
    : executor_{executor}, input_{executor, read_fd}, output_{executor, write_fd} {
  ignore_sigpipe();
}

PipeTransport::~PipeTransport() {
  boost::system::error_code ec;
  input_.close(ec);
  output_.close(ec);
}

// ------------------------------------------------------------------------------------------- close

void PipeTransport::close() {
  if (is_closed_)
    return;
  is_closed_ = true;
  boost::system::error_code ec;
  input_.close(ec);
  if (ec)
    LOG_DEBUG("closing transport input: {}", ec.message());
  output_.close(ec);
  if (ec)
    LOG_DEBUG("closing transport output: {}", ec.message());
}

// -------------------------------------------------------------------------------- async_read_frame

boost::asio::awaitable<error_code> PipeTransport::async_read_frame(BufferType& frame) {
  using boost::asio::redirect_error;
  using boost::asio::use_awaitable;

  // Holds the descriptors open until the read completes
  auto self = shared_from_this();

  if (is_closed_)
    co_return make_error_code(ecode::stream_closed);

  uint32_t length = 0;
  boost::system::error_code ec;
  const auto n = co_await boost::asio::async_read(
      input_, boost::asio::buffer(&length, sizeof(length)), redirect_error(use_awaitable, ec));
  if (ec == boost::asio::error::eof)
    co_return make_error_code(n == 0 ? ecode::stream_closed : ecode::premature_eof);
  if (ec)
    co_return static_cast<error_code>(ec);

  boost::endian::big_to_native_inplace(length);
  if (length > k_max_frame_size)
    co_return make_error_code(ecode::object_too_large);

  frame.resize(length);
  if (length > 0) {
    co_await boost::asio::async_read(input_, boost::asio::buffer(frame.data(), frame.size()),
                                     redirect_error(use_awaitable, ec));
    if (ec == boost::asio::error::eof)
      co_return make_error_code(ecode::premature_eof);
    if (ec)
      co_return static_cast<error_code>(ec);
  }

  co_return error_code{};
}

// -------------------------------------------------------------------------------------- send_frame

void PipeTransport::send_frame(BufferType frame) {
  if (is_closed_) {
    LOG_DEBUG("dropping frame of {} bytes, transport is closed", frame.size());
    return;
  }
  if (frame.size() > k_max_frame_size) {
    LOG_ERR("refusing to send frame of {} bytes", frame.size());
    return;
  }

  const auto length = boost::endian::native_to_big(uint32_t(frame.size()));
  BufferType buffer(sizeof(length) + frame.size());
  std::memcpy(buffer.data(), &length, sizeof(length));
  if (frame.size() > 0)
    std::memcpy(buffer.data() + sizeof(length), frame.data(), frame.size());

  outbox_.push_back(std::move(buffer));
  if (!is_writing_)
    write_next_();
}

void PipeTransport::write_next_() {
  if (is_closed_)
    outbox_.clear();
  if (outbox_.empty()) {
    is_writing_ = false;
    return;
  }

  is_writing_ = true;
  auto self = std::static_pointer_cast<PipeTransport>(shared_from_this());
  boost::asio::async_write(output_, boost::asio::buffer(outbox_.front()),
                           [self](const boost::system::error_code& ec, std::size_t) {
                             if (ec) {
                               if (!self->is_closed_)
                                 WARN("transport write failed: {}", ec.message());
                               self->is_writing_ = false;
                               self->close();
                               self->outbox_.clear();
                               return;
                             }
                             if (!self->outbox_.empty())
                               self->outbox_.pop_front();
                             self->write_next_();
                           });
}

// ---------------------------------------------------------------------------------- make_pipe_pair

expected<std::pair<shared_ptr<Transport>, shared_ptr<Transport>>, error_code>
make_pipe_pair(Transport::executor_type executor_a, Transport::executor_type executor_b) {
  int a_to_b[2] = {-1, -1};
  int b_to_a[2] = {-1, -1};
  if (::pipe2(a_to_b, O_CLOEXEC) != 0)
    return make_unexpected(last_system_error());
  if (::pipe2(b_to_a, O_CLOEXEC) != 0) {
    const auto ec = last_system_error();
    ::close(a_to_b[0]);
    ::close(a_to_b[1]);
    return make_unexpected(ec);
  }

  shared_ptr<Transport> a = make_shared<PipeTransport>(executor_a, b_to_a[0], a_to_b[1]);
  shared_ptr<Transport> b = make_shared<PipeTransport>(executor_b, a_to_b[0], b_to_a[1]);
  return std::make_pair(std::move(a), std::move(b));
}

// ---------------------------------------------------------------------------- open_stdio_transport

expected<shared_ptr<Transport>, error_code> open_stdio_transport(Transport::executor_type executor) {
  const int read_fd = ::fcntl(STDIN_FILENO, F_DUPFD_CLOEXEC, 3);
  if (read_fd < 0)
    return make_unexpected(last_system_error());

  const int write_fd = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
  if (write_fd < 0) {
    const auto ec = last_system_error();
    ::close(read_fd);
    return make_unexpected(ec);
  }

  const int dev_null = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (dev_null >= 0) {
    ::dup2(dev_null, STDOUT_FILENO);
    ::close(dev_null);
  } else {
    WARN("failed to redirect stdout to /dev/null: {}", last_system_error().message());
  }

  return make_shared<PipeTransport>(executor, read_fd, write_fd);
}

} // namespace toolbridge::net
