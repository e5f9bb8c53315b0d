// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "toolbridge/bridge.hpp"
#include "toolbridge/net.hpp"
#include "toolbridge/tools/reminder-client.hpp"
#include "toolbridge/utils.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace toolbridge {

struct Config {
  bool show_help{false};
  net::WorkerCommand server{"reminder-server", {}};
  std::chrono::milliseconds timeout{10s};
  std::chrono::milliseconds reconnect_delay{5s};
  int notification_capacity{0};
};

static void show_help(const char* exec) {
  cout << format(R"V0G0N(

   Usage: {} [OPTIONS...]

      Interactive front-end for a reminder server, spawned as a worker process.

   Options:

      --server <command>         Worker command line (default: reminder-server)
      --arg <value>              Append an argument to the worker command
      --timeout <seconds>        Request timeout (default: 10)
      --reconnect-delay <sec>    Delay between connection attempts (default: 5)
      --capacity <n>             Notification queue capacity; 0 is unbounded (default: 0)
      -h|--help                  Show this help

)V0G0N",
                 exec);
}

static bool parse_config(int argc, char** argv, Config& config) {
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "--server") {
        auto words = cli::parse_cmd_args(cli::safe_arg_str(argc, argv, i));
        if (words.empty())
          throw std::runtime_error("empty --server command");
        config.server.program = words.front();
        config.server.arguments.assign(std::next(begin(words)), end(words));
      } else if (arg == "--arg") {
        config.server.arguments.push_back(cli::safe_arg_str(argc, argv, i));
      } else if (arg == "--timeout") {
        config.timeout = cli::safe_arg_seconds(argc, argv, i);
      } else if (arg == "--reconnect-delay") {
        config.reconnect_delay = cli::safe_arg_seconds(argc, argv, i);
      } else if (arg == "--capacity") {
        config.notification_capacity = cli::safe_arg_int(argc, argv, i);
        if (config.notification_capacity < 0)
          throw std::runtime_error("--capacity must not be negative");
      } else {
        cout << format("unexpected argument: '{}'", arg) << endl;
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      cout << format("Error on command-line: {}", e.what()) << endl;
      has_error = true;
    }
  }

  return !has_error;
}

// ------------------------------------------------------------------------------------------- menu

class ReminderCli {
private:
  bridge::SessionBridge& bridge_;
  tools::ReminderClient client_;
  std::chrono::milliseconds timeout_;
  std::mutex console_padlock_;
  std::atomic<bool> done_{false};
  bool tools_shown_{false};

  template <typename... Args> void print_(fmt::format_string<Args...> fmt, Args&&... args) {
    std::lock_guard lock{console_padlock_};
    cout << format(fmt, std::forward<Args>(args)...) << std::flush;
  }

  std::optional<string> prompt_(string_view prompt) {
    print_("{}", prompt);
    string line;
    if (!std::getline(std::cin, line))
      return std::nullopt;
    return line;
  }

  void show_tools_() {
    if (tools_shown_)
      return;
    const auto tools = client_.tools();
    if (tools.empty())
      return;
    tools_shown_ = true;
    print_("\nAvailable commands:\n{}\n", string(30, '-'));
    for (const auto& tool : tools)
      print_("📌 {}: {}\n", tool.name, tool.description);
  }

public:
  ReminderCli(bridge::SessionBridge& bridge, std::chrono::milliseconds timeout)
      : bridge_{bridge}, client_{bridge}, timeout_{timeout} {}

  /**
   * @brief Prints notifications as they arrive, until `run` finishes.
   */
  void print_notifications() {
    auto& queue = bridge_.notifications();
    while (!done_.load(std::memory_order_acquire)) {
      auto notification = queue.wait_pop(250ms);
      if (!notification) {
        if (queue.is_closed())
          break;
        continue;
      }
      const auto status = tools::decode_status_notification(notification->payload);
      print_("\n\n🔔 {}\n\nChoice > ", status.has_value() ? *status : notification->payload);
    }
  }

  void run() {
    const auto rule = string(30, '-');
    print_("{}\nREMINDER MANAGER\n{}\n", string(50, '='), string(50, '='));

    while (true) {
      show_tools_();
      print_("\n{}\nWhat would you like to do?\n{}\n", rule, rule);
      print_("1. Set new reminder\n2. List active reminders\n3. Cancel a reminder\n4. Exit\n{}\n",
             rule);

      const auto choice = prompt_("Choice > ");
      if (!choice || *choice == "4") {
        print_("\nGoodbye! 👋\n");
        break;
      }

      if (*choice == "1") {
        print_("\nSetting new reminder:\n{}\n", rule);
        const auto minutes_str = prompt_("Minutes from now > ");
        if (!minutes_str)
          break;
        int minutes = 0;
        try {
          minutes = std::stoi(*minutes_str);
        } catch (const std::exception&) {
          print_("❌ '{}' is not a number of minutes\n", *minutes_str);
          continue;
        }
        const auto message = prompt_("Reminder message > ");
        if (!message)
          break;
        const auto result = client_.set_reminder(minutes, *message, timeout_);
        print_("\n{}\n", tools::describe_result(result));
      } else if (*choice == "2") {
        print_("\n{}\n", tools::describe_result(client_.list_reminders(timeout_)));
      } else if (*choice == "3") {
        print_("\nCancelling reminder:\n{}\n", rule);
        const auto task_id = prompt_("Reminder ID to cancel > ");
        if (!task_id)
          break;
        print_("\n{}\n", tools::describe_result(client_.cancel_reminder(*task_id, timeout_)));
      } else {
        print_("Please choose 1, 2, 3 or 4\n");
      }
    }

    done_.store(true, std::memory_order_release);
  }
};

// ------------------------------------------------------------------------------------------- main

int main(int argc, char** argv) {
  Config config;
  if (!parse_config(argc, argv, config)) {
    cout << format("aborting...") << endl;
    return EXIT_FAILURE;
  }

  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  bridge::BridgeConfig bridge_config;
  bridge_config.transport_factory = [command = config.server](net::Transport::executor_type ex) {
    return net::spawn_worker(ex, command);
  };
  bridge_config.reconnect_delay = config.reconnect_delay;
  bridge_config.default_timeout = config.timeout;
  bridge_config.notification_capacity = std::size_t(config.notification_capacity);
  bridge_config.session.client_name = "reminder-cli";

  bridge::SessionBridge bridge{std::move(bridge_config)};
  bridge.start();

  ReminderCli cli{bridge, config.timeout};
  std::thread printer{[&cli]() { cli.print_notifications(); }};
  cli.run();

  bridge.stop();
  printer.join();
  return EXIT_SUCCESS;
}

} // namespace toolbridge

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return toolbridge::main(argc, argv); }

#endif
