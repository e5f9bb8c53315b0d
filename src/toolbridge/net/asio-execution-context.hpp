#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <optional>
#include <string>
#include <thread>

namespace toolbridge::net {

/**
 * @brief An `io_context` driven by exactly one dedicated thread.
 *
 * All work posted to the executor runs in FIFO order, and never in parallel.
 * `stop()` lets outstanding work finish (it does not call `io_context::stop`),
 * so anything running on the context must be told to wind down first.
 */
class AsioExecutionContext {
private:
  using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context io_context_{1};
  std::optional<work_guard_type> work_guard_;
  std::thread thread_;
  std::thread::id thread_id_{};

public:
  AsioExecutionContext() = default;
  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;
  ~AsioExecutionContext() { stop(); }

  /** @brief Start the thread */
  void run() {
    if (is_running())
      return;
    work_guard_.emplace(io_context_.get_executor());
    thread_ = std::thread{[this]() { io_context_.run(); }};
    thread_id_ = thread_.get_id();
  }

  /** @brief Release the work guard and join the thread, once it has run out of work */
  void stop() {
    work_guard_.reset();
    if (thread_.joinable() && std::this_thread::get_id() != thread_id_)
      thread_.join();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return thread_.joinable(); }

  /** @brief true iff called from the context's own thread */
  bool is_current_thread() const noexcept { return std::this_thread::get_id() == thread_id_; }

  /** @brief Return the executor for running jobs on the context */
  boost::asio::any_io_executor get_executor() { return io_context_.get_executor(); }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace toolbridge::net
