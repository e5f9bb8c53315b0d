#pragma once

#include "stdinc.hpp"

#include "toolbridge/bridge/bridge-config.hpp"
#include "toolbridge/net/asio-execution-context.hpp"
#include "toolbridge/net/co-spawn.hpp"
#include "toolbridge/net/pipe-transport.hpp"
#include "toolbridge/net/rpc/envelope.hpp"
#include "toolbridge/net/rpc/rpc-server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <mutex>
#include <thread>

namespace toolbridge::test {

/**
 * Polls `predicate` until it holds, or `timeout` passes.
 */
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

/**
 * Answers the handshake, and nothing else.
 */
inline boost::asio::awaitable<void> serve_silently(shared_ptr<net::Transport> transport) {
  net::BufferType frame;
  while (true) {
    const auto ec = co_await transport->async_read_frame(frame);
    if (ec)
      co_return;
    net::detail::RequestEnvelopeHeader header;
    if (!net::detail::decode(header, net::to_span_bytes(frame)))
      continue;
    if (header.method != net::detail::k_initialize_method)
      continue; // never answer
    net::BufferType reply;
    if (net::detail::encode_response(reply, header.request_id, net::Status{}, "{}"))
      transport->send_frame(std::move(reply));
  }
}

/**
 * A worker "process" on its own thread, connected through pipes.
 * Every call to the factory makes a fresh connection and a fresh `RpcServer`.
 * Must outlive any bridge using its factory.
 */
class InProcessWorker {
public:
  using Setup = std::function<void(net::RpcServer& server)>;

private:
  net::AsioExecutionContext context_;
  Setup setup_;
  bool is_silent_{false};
  std::atomic<bool> refuse_{false};
  std::atomic<int> connections_{0};
  std::mutex padlock_;
  std::vector<shared_ptr<net::Transport>> transports_;

public:
  explicit InProcessWorker(Setup setup, bool is_silent = false)
      : setup_{std::move(setup)}, is_silent_{is_silent} {
    context_.run();
  }

  ~InProcessWorker() {
    drop_connections();
    context_.stop();
  }

  static std::string server_info() { return R"({"name":"test-worker","version":"1","tools":[]})"; }

  /** @brief Make the factory fail, as if the worker could not be spawned */
  void set_refuse(bool value) { refuse_.store(value); }

  int connections() const { return connections_.load(); }

  net::Transport::executor_type get_executor() { return context_.get_executor(); }

  /** @brief Close the worker end of every connection, as if the worker crashed */
  void drop_connections() {
    std::vector<shared_ptr<net::Transport>> transports;
    {
      std::lock_guard lock{padlock_};
      transports.swap(transports_);
    }
    for (auto& transport : transports)
      boost::asio::post(context_.get_executor(), [transport]() { transport->close(); });
  }

  bridge::TransportFactory factory() {
    return [this](net::Transport::executor_type executor)
               -> expected<shared_ptr<net::Transport>, error_code> {
      if (refuse_.load())
        return make_unexpected(std::make_error_code(std::errc::connection_refused));

      auto pair = net::make_pipe_pair(executor, context_.get_executor());
      if (!pair.has_value())
        return make_unexpected(pair.error());

      auto worker_end = pair->second;
      {
        std::lock_guard lock{padlock_};
        transports_.push_back(worker_end);
      }
      connections_.fetch_add(1);

      if (is_silent_) {
        boost::asio::co_spawn(context_.get_executor(), serve_silently(worker_end),
                              net::log_on_exception("silent worker"));
      } else {
        auto server = make_shared<net::RpcServer>(worker_end, server_info());
        if (setup_)
          setup_(*server);
        boost::asio::co_spawn(context_.get_executor(), server->run(),
                              [server](std::exception_ptr ex_ptr, error_code) {
                                net::log_on_exception("test worker")(ex_ptr);
                              });
      }
      return pair->first;
    };
  }
};

} // namespace toolbridge::test
