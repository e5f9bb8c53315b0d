#pragma once

#include "tool-content.hpp"

#include "toolbridge/bridge/session-bridge.hpp"

#include <chrono>
#include <optional>

namespace toolbridge::tools {

/**
 * @brief Typed calls to the reminder server's tools, over a `SessionBridge`.
 *
 * Results are decoded `ToolResult`s; transport and remote failures are passed
 * through as the bridge reports them.
 */
class ReminderClient {
private:
  bridge::SessionBridge& bridge_;

  expected<ToolResult, net::Status> call_(std::string_view tool, const nlohmann::json& args,
                                          std::optional<std::chrono::milliseconds> timeout);

public:
  explicit ReminderClient(bridge::SessionBridge& bridge) : bridge_{bridge} {}

  expected<ToolResult, net::Status>
  set_reminder(int minutes, std::string_view message,
               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  expected<ToolResult, net::Status>
  list_reminders(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  expected<ToolResult, net::Status>
  cancel_reminder(std::string_view task_id,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /**
   * @brief The tools advertised in the handshake; empty until connected.
   */
  std::vector<ToolDescription> tools() const;
};

/**
 * @brief Text for a tool outcome, with a "SUCCESS!" or "ERROR!" banner when the result
 *        text starts with ✅ or ❌, or when the call itself failed.
 */
std::string describe_result(const expected<ToolResult, net::Status>& result);

} // namespace toolbridge::tools
