#include "stdinc.hpp"

#include "toolbridge/bridge.hpp"
#include "toolbridge/net.hpp"
#include "toolbridge/net/co-spawn.hpp"

#include <boost/asio/co_spawn.hpp>

#include <thread>

namespace toolbridge::example
{

// A "worker" that runs in-process, on its own thread, and answers `echo` and `tick`
static bridge::TransportFactory make_worker_factory(net::AsioExecutionContext& worker_context)
{
   return [&worker_context](net::Transport::executor_type executor)
              -> expected<shared_ptr<net::Transport>, error_code> {
      auto pair = net::make_pipe_pair(executor, worker_context.get_executor());
      if(!pair.has_value()) return make_unexpected(pair.error());

      auto server = make_shared<net::RpcServer>(pair->second, R"({"name":"example-worker"})");
      server->register_handler("echo", [](const std::string& payload) -> net::CallResult {
         return payload;
      });
      server->register_handler("tick", [weak = std::weak_ptr{server}](const std::string& payload)
                                           -> net::CallResult {
         if(auto server = weak.lock()) server->notify(format("tick: {}", payload));
         return "ok";
      });

      boost::asio::co_spawn(worker_context.get_executor(),
                            server->run(),
                            [server](std::exception_ptr ex_ptr, error_code ec) {
                               net::log_on_exception("example worker")(ex_ptr);
                               INFO("worker connection ended: {}", ec.message());
                            });
      return pair->first;
   };
}

static void session_bridge_example()
{
   net::AsioExecutionContext worker_context;
   worker_context.run();

   {
      bridge::BridgeConfig config;
      config.transport_factory = make_worker_factory(worker_context);
      config.reconnect_delay   = 100ms;
      config.default_timeout   = 1s;

      bridge::SessionBridge bridge{std::move(config)};

      // Not connected yet
      const auto early = bridge.request("echo", "too early");
      INFO("before start: {}", early.has_value() ? *early : early.error().to_string());

      bridge.start();
      while(!bridge.is_ready()) std::this_thread::sleep_for(10ms);
      INFO("connected to {}", bridge.server_info());

      for(int i = 0; i < 3; ++i) {
         const auto result = bridge.request("echo", format("hello #{}", i));
         INFO("echo: {}", result.has_value() ? *result : result.error().to_string());
         const auto tick = bridge.request("tick", std::to_string(i), 500ms);
         if(!tick.has_value()) WARN("tick failed: {}", tick.error().to_string());
      }

      const auto unknown = bridge.request("nothing", "{}");
      INFO("unknown tool: {}", unknown.has_value() ? *unknown : unknown.error().to_string());

      while(auto notification = bridge.notifications().wait_pop(200ms))
         INFO("notification: {}", notification->payload);

      bridge.stop();
   }

   worker_context.stop();
   INFO("Done");
}

} // namespace toolbridge::example

int main(int, char**)
{
   toolbridge::example::session_bridge_example();
   return EXIT_SUCCESS;
}
