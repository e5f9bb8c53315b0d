#include "tool-content.hpp"

namespace toolbridge::tools {

using nlohmann::json;

// ---------------------------------------------------------------------------------------- to/from

void to_json(json& j, const ContentItem& o) {
  if (o.type == "image")
    j = json{{"type", o.type}, {"data", o.data}, {"mimeType", o.mime_type}};
  else
    j = json{{"type", o.type}, {"text", o.text}};
}

void from_json(const json& j, ContentItem& o) {
  j.at("type").get_to(o.type);
  if (o.type == "image") {
    j.at("data").get_to(o.data);
    j.at("mimeType").get_to(o.mime_type);
  } else {
    o.text = j.value("text", std::string{});
  }
}

void to_json(json& j, const ToolResult& o) {
  j = json{{"content", o.content}, {"isError", o.is_error}};
}

void from_json(const json& j, ToolResult& o) {
  j.at("content").get_to(o.content);
  o.is_error = j.value("isError", false);
}

void to_json(json& j, const ToolDescription& o) {
  j = json{{"name", o.name}, {"description", o.description}};
}

void from_json(const json& j, ToolDescription& o) {
  j.at("name").get_to(o.name);
  o.description = j.value("description", std::string{});
}

void to_json(json& j, const ServerInfo& o) {
  j = json{{"name", o.name}, {"version", o.version}, {"tools", o.tools}};
}

void from_json(const json& j, ServerInfo& o) {
  j.at("name").get_to(o.name);
  o.version = j.value("version", std::string{});
  o.tools = j.value("tools", std::vector<ToolDescription>{});
}

// ------------------------------------------------------------------------------------------ decode

namespace {
  template <typename T> expected<T, net::Status> decode_as(std::string_view payload,
                                                           std::string_view what) {
    try {
      return json::parse(payload.begin(), payload.end()).get<T>();
    } catch (const json::exception& e) {
      return make_unexpected(
          net::Status{net::StatusCode::DATA_LOSS, format("invalid {}", what), e.what()});
    }
  }
} // namespace

std::string ToolResult::text() const {
  std::string out;
  for (const auto& item : content) {
    if (item.type != "text")
      continue;
    if (!out.empty())
      out += '\n';
    out += item.text;
  }
  return out;
}

ToolResult text_result(std::string text, bool is_error) {
  ToolResult result;
  result.content.push_back(ContentItem{"text", std::move(text), {}, {}});
  result.is_error = is_error;
  return result;
}

std::string encode_tool_result(const ToolResult& result) { return json(result).dump(); }

expected<ToolResult, net::Status> decode_tool_result(std::string_view payload) {
  return decode_as<ToolResult>(payload, "tool result");
}

std::string encode_server_info(const ServerInfo& info) { return json(info).dump(); }

expected<ServerInfo, net::Status> decode_server_info(std::string_view payload) {
  return decode_as<ServerInfo>(payload, "server info");
}

std::string encode_status_notification(std::string_view status) {
  return json{{"status", std::string{status}}}.dump();
}

expected<std::string, net::Status> decode_status_notification(std::string_view payload) {
  try {
    const auto j = json::parse(payload.begin(), payload.end());
    return j.at("status").get<std::string>();
  } catch (const json::exception& e) {
    return make_unexpected(
        net::Status{net::StatusCode::DATA_LOSS, "invalid status notification", e.what()});
  }
}

expected<json, net::Status> parse_arguments(std::string_view payload) {
  if (payload.empty())
    return json::object();
  try {
    auto j = json::parse(payload.begin(), payload.end());
    if (!j.is_object())
      return make_unexpected(
          net::Status{net::StatusCode::INVALID_ARGUMENT, "arguments must be a JSON object"});
    return j;
  } catch (const json::parse_error& e) {
    return make_unexpected(
        net::Status{net::StatusCode::INVALID_ARGUMENT, "arguments are not valid JSON", e.what()});
  }
}

} // namespace toolbridge::tools
