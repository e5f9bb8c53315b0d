#include "reminder-client.hpp"

namespace toolbridge::tools {

using nlohmann::json;

expected<ToolResult, net::Status>
ReminderClient::call_(std::string_view tool, const json& args,
                      std::optional<std::chrono::milliseconds> timeout) {
  const auto payload = bridge_.request(tool, args.dump(), timeout);
  if (!payload.has_value())
    return make_unexpected(payload.error());
  return decode_tool_result(*payload);
}

expected<ToolResult, net::Status>
ReminderClient::set_reminder(int minutes, std::string_view message,
                             std::optional<std::chrono::milliseconds> timeout) {
  return call_("set_reminder", json{{"minutes", minutes}, {"message", std::string{message}}},
               timeout);
}

expected<ToolResult, net::Status>
ReminderClient::list_reminders(std::optional<std::chrono::milliseconds> timeout) {
  return call_("list_reminders", json::object(), timeout);
}

expected<ToolResult, net::Status>
ReminderClient::cancel_reminder(std::string_view task_id,
                                std::optional<std::chrono::milliseconds> timeout) {
  return call_("cancel_reminder", json{{"task_id", std::string{task_id}}}, timeout);
}

std::vector<ToolDescription> ReminderClient::tools() const {
  const auto info = bridge_.server_info();
  if (info.empty())
    return {};
  const auto decoded = decode_server_info(info);
  if (!decoded.has_value()) {
    WARN("bad handshake reply: {}", decoded.error().to_string());
    return {};
  }
  return decoded->tools;
}

std::string describe_result(const expected<ToolResult, net::Status>& result) {
  const std::string rule(50, '=');
  auto banner = [&rule](std::string_view title, std::string_view text) {
    return format("{}\n{}\n{}\n{}\n{}", rule, title, rule, text, rule);
  };

  if (!result.has_value()) {
    if (result.error().error_code() == net::StatusCode::NOT_READY)
      return "Server not ready, please wait...";
    return banner("ERROR OCCURRED!", format("Error: {}", result.error().to_string()));
  }

  const auto text = result->text();
  if (result->is_error || text.starts_with("❌"))
    return banner("ERROR!", text);
  if (text.starts_with("✅"))
    return banner("SUCCESS!", text);
  return text;
}

} // namespace toolbridge::tools
