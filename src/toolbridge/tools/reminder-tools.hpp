#pragma once

#include "tool-content.hpp"

#include "toolbridge/net/rpc/rpc-server.hpp"
#include "toolbridge/server/scheduled-task-registry.hpp"

#include <chrono>

namespace toolbridge::tools {

/**
 * @brief "Due any moment!", "Due in 1 minute", or "Due in N minutes"
 */
std::string format_time_left(std::chrono::milliseconds remaining);

/**
 * @brief The payload published when a reminder fires: `{"status": "⏰ Reminder: <message>"}`
 */
std::string reminder_notification(std::string_view message);

/**
 * @brief The reminder server's tools (`set_reminder`, `cancel_reminder`, `list_reminders`),
 *        backed by a `ScheduledTaskRegistry`.
 *
 * Each tool takes a JSON object of arguments, and returns an encoded `ToolResult`.
 * Bad arguments are an `INVALID_ARGUMENT` error status.
 */
class ReminderTools {
private:
  server::ScheduledTaskRegistry& registry_;

public:
  explicit ReminderTools(server::ScheduledTaskRegistry& registry) : registry_{registry} {}

  /**
   * @brief `{"minutes": int >= 1, "message": string}`, or `{"seconds": number > 0, ...}`
   */
  expected<std::string, net::Status> set_reminder(const std::string& payload);

  /**
   * @brief `{"task_id": string}`
   */
  expected<std::string, net::Status> cancel_reminder(const std::string& payload);

  expected<std::string, net::Status> list_reminders(const std::string& payload);

  /**
   * @brief Register all three tools with `server`.
   */
  void install(net::RpcServer& server);

  static ServerInfo server_info();
};

} // namespace toolbridge::tools
