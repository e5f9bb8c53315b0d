
#include "stdinc.hpp"

#include "toolbridge/net.hpp"
#include "toolbridge/net/co-spawn.hpp"
#include "toolbridge/server/scheduled-task-registry.hpp"
#include "toolbridge/tools/reminder-tools.hpp"
#include "toolbridge/utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace toolbridge {

struct ServerConfig {
  bool show_help{false};
  string log_file{"/tmp/reminder_server.log"};
};

static void show_help(const char* exec) {
  std::cerr << format(R"V0G0N(

   Usage: {} [OPTIONS...]

      Reminder tool server. Serves requests on stdin/stdout; launched by a front-end.

   Options:

      --log-file <path>    Log file (default: /tmp/reminder_server.log)
      -h|--help            Show this help

)V0G0N",
                      exec);
}

int server_main(int argc, char** argv) {
  ServerConfig config;
  auto has_error = false;

  // stdout is the transport: report problems on stderr only
  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "--log-file") {
        config.log_file = cli::safe_arg_str(argc, argv, i);
      } else {
        std::cerr << format("unexpected argument: '{}'", arg) << endl;
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      std::cerr << format("Error on command-line: {}", e.what()) << endl;
      has_error = true;
    }
  }

  if (has_error)
    return EXIT_FAILURE;

  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (!logging::init_file_logger(config.log_file))
    std::cerr << format("failed to open log file '{}', logging to stderr", config.log_file)
              << endl;

  INFO("starting reminder server");

  boost::asio::io_context io_context{1};
  auto transport = net::open_stdio_transport(io_context.get_executor());
  if (!transport.has_value()) {
    LOG_ERR("failed to open stdio transport: {}", transport.error().message());
    return EXIT_FAILURE;
  }

  auto rpc_server = make_shared<net::RpcServer>(
      *transport, tools::encode_server_info(tools::ReminderTools::server_info()));

  auto publish = [&rpc_server](const string& message) {
    return rpc_server->notify(tools::reminder_notification(message));
  };
  server::ScheduledTaskRegistry registry{io_context.get_executor(), publish};

  tools::ReminderTools reminder_tools{registry};
  reminder_tools.install(*rpc_server);

  boost::asio::co_spawn(io_context, rpc_server->run(),
                        [&registry](std::exception_ptr ex_ptr, error_code ec) {
                          net::log_on_exception("reminder server")(ex_ptr);
                          INFO("client disconnected ({}), cancelling {} reminders", ec.message(),
                               registry.size());
                          registry.cancel_all();
                        });

  io_context.run();
  INFO("reminder server stopped");
  return EXIT_SUCCESS;
}

} // namespace toolbridge

int main(int argc, char** argv) { return toolbridge::server_main(argc, argv); }
