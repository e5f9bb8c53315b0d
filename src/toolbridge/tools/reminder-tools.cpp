#include "reminder-tools.hpp"

#include <cmath>

namespace toolbridge::tools {

using namespace std::chrono;
using nlohmann::json;

namespace {
  net::Status invalid_argument(std::string message) {
    return net::Status{net::StatusCode::INVALID_ARGUMENT, std::move(message)};
  }

  constexpr auto k_max_delay = server::ScheduledTaskRegistry::k_max_delay;
  constexpr auto k_max_minutes = duration_cast<minutes>(k_max_delay).count();
  constexpr auto k_max_seconds = duration_cast<seconds>(k_max_delay).count();
} // namespace

std::string format_time_left(milliseconds remaining) {
  const double minutes = double(remaining.count()) / 60'000.0;
  if (minutes < 1.0)
    return "Due any moment!";
  if (minutes < 2.0)
    return "Due in 1 minute";
  return format("Due in {} minutes", int64_t(minutes));
}

std::string reminder_notification(std::string_view message) {
  return encode_status_notification(format("⏰ Reminder: {}", message));
}

ServerInfo ReminderTools::server_info() {
  ServerInfo info;
  info.name = "reminder-server";
  info.version = "0.1.0";
  info.tools = {{"set_reminder", "Set a reminder for X minutes from now"},
                {"cancel_reminder", "Cancel a specific reminder"},
                {"list_reminders", "List all active reminders"}};
  return info;
}

void ReminderTools::install(net::RpcServer& server) {
  server.register_handler("set_reminder",
                          [this](const std::string& payload) { return set_reminder(payload); });
  server.register_handler("cancel_reminder",
                          [this](const std::string& payload) { return cancel_reminder(payload); });
  server.register_handler("list_reminders",
                          [this](const std::string& payload) { return list_reminders(payload); });
}

// ------------------------------------------------------------------------------------ set_reminder

expected<std::string, net::Status> ReminderTools::set_reminder(const std::string& payload) {
  const auto args = parse_arguments(payload);
  if (!args.has_value())
    return make_unexpected(args.error());

  const auto message = args->find("message");
  if (message == args->end() || !message->is_string())
    return make_unexpected(invalid_argument("'message' must be a string"));

  milliseconds delay{0};
  std::string delay_text;
  if (const auto minutes = args->find("minutes"); minutes != args->end()) {
    if (!minutes->is_number_integer() || minutes->get<int64_t>() < 1 ||
        minutes->get<int64_t>() > k_max_minutes)
      return make_unexpected(
          invalid_argument(format("'minutes' must be an integer from 1 to {}", k_max_minutes)));
    const auto n = minutes->get<int64_t>();
    delay = duration_cast<milliseconds>(std::chrono::minutes{n});
    delay_text = format("{} minutes", n);
  } else if (const auto seconds = args->find("seconds"); seconds != args->end()) {
    if (!seconds->is_number() || !(seconds->get<double>() > 0.0) ||
        seconds->get<double>() > double(k_max_seconds))
      return make_unexpected(
          invalid_argument(format("'seconds' must be a number > 0 and <= {}", k_max_seconds)));
    const auto n = seconds->get<double>();
    delay = milliseconds{std::max<int64_t>(1, std::llround(n * 1000.0))};
    delay_text = format("{} seconds", n);
  } else {
    return make_unexpected(invalid_argument("one of 'minutes' or 'seconds' is required"));
  }

  const auto id = registry_.add(delay, message->get<std::string>());
  if (!id.has_value())
    return make_unexpected(id.error());

  return encode_tool_result(
      text_result(format("✅ Reminder set! Will notify in {}\nID: {}", delay_text, *id)));
}

// --------------------------------------------------------------------------------- cancel_reminder

expected<std::string, net::Status> ReminderTools::cancel_reminder(const std::string& payload) {
  const auto args = parse_arguments(payload);
  if (!args.has_value())
    return make_unexpected(args.error());

  const auto task_id = args->find("task_id");
  if (task_id == args->end() || !task_id->is_string())
    return make_unexpected(invalid_argument("'task_id' must be a string"));

  const auto id = task_id->get<std::string>();
  if (registry_.cancel(id))
    return encode_tool_result(text_result(format("✅ Cancelled reminder: {}", id)));
  return encode_tool_result(text_result(format("❌ Reminder not found: {}", id)));
}

// ---------------------------------------------------------------------------------- list_reminders

expected<std::string, net::Status> ReminderTools::list_reminders(const std::string& payload) {
  const auto args = parse_arguments(payload);
  if (!args.has_value())
    return make_unexpected(args.error());

  const auto tasks = registry_.list();
  if (tasks.empty())
    return encode_tool_result(text_result("No active reminders"));

  std::string text = "Active reminders:";
  for (const auto& task : tasks)
    text += format("\n• {} ({})", task.id, format_time_left(task.remaining));
  return encode_tool_result(text_result(std::move(text)));
}

} // namespace toolbridge::tools
