#pragma once

#include "toolbridge/net/rpc/status.hpp"

#include "stdinc.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

/**
 * JSON payloads exchanged with tool servers. The session core treats these as
 * opaque bytes; only tool servers and front-ends parse them.
 */

namespace toolbridge::tools {

/**
 * @brief One item of a tool result: either text, or a base64 encoded image.
 */
struct ContentItem {
  std::string type{"text"};
  std::string text{};
  std::string data{};      //!< Base64 image data, iff `type == "image"`
  std::string mime_type{}; //!< iff `type == "image"`

  bool operator==(const ContentItem&) const = default;
};

struct ToolResult {
  std::vector<ContentItem> content{};
  bool is_error{false};

  /** @brief All text items, joined with newlines */
  std::string text() const;

  bool operator==(const ToolResult&) const = default;
};

struct ToolDescription {
  std::string name{};
  std::string description{};

  bool operator==(const ToolDescription&) const = default;
};

/**
 * @brief The handshake reply of a tool server.
 */
struct ServerInfo {
  std::string name{};
  std::string version{};
  std::vector<ToolDescription> tools{};

  bool operator==(const ServerInfo&) const = default;
};

void to_json(nlohmann::json& j, const ContentItem& o);
void from_json(const nlohmann::json& j, ContentItem& o);
void to_json(nlohmann::json& j, const ToolResult& o);
void from_json(const nlohmann::json& j, ToolResult& o);
void to_json(nlohmann::json& j, const ToolDescription& o);
void from_json(const nlohmann::json& j, ToolDescription& o);
void to_json(nlohmann::json& j, const ServerInfo& o);
void from_json(const nlohmann::json& j, ServerInfo& o);

ToolResult text_result(std::string text, bool is_error = false);

std::string encode_tool_result(const ToolResult& result);
expected<ToolResult, net::Status> decode_tool_result(std::string_view payload);

std::string encode_server_info(const ServerInfo& info);
expected<ServerInfo, net::Status> decode_server_info(std::string_view payload);

/**
 * @brief Payload of a notification: `{"status": <text>}`
 */
std::string encode_status_notification(std::string_view status);
expected<std::string, net::Status> decode_status_notification(std::string_view payload);

/**
 * @brief Parse tool arguments, which must be a JSON object.
 * @return `INVALID_ARGUMENT` if `payload` is not a JSON object. An empty payload is `{}`.
 */
expected<nlohmann::json, net::Status> parse_arguments(std::string_view payload);

} // namespace toolbridge::tools
