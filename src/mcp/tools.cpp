#include "mcp/tools.hpp"

#include "mcp/json_utils.hpp"

namespace mcp {

void to_json(nlohmann::json& j, const Tool& p) {
  to_json_required(j, "name", p.name);
  to_json_optional(j, "title", p.title);
  to_json_required(j, "description", p.description);
  to_json_required(j, "inputSchema", p.inputSchema);
}

void from_json(const nlohmann::json& j, Tool& p) {
  from_json_required(j, "name", p.name);
  from_json_optional(j, "title", p.title);
  from_json_required(j, "description", p.description);
  from_json_required(j, "inputSchema", p.inputSchema);
}

// List Tools Request
void to_json(nlohmann::json& j, const ListToolsParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "cursor", p.cursor);
}

void from_json(const nlohmann::json& j, ListToolsParams& p) {
  if (j.is_object()) {
    from_json_optional(j, "cursor", p.cursor);
  }
}

void to_json(nlohmann::json& j, const ListToolsResult& p) {
  to_json_required(j, "tools", p.tools);
  to_json_optional(j, "nextCursor", p.nextCursor);
}

void from_json(const nlohmann::json& j, ListToolsResult& p) {
  from_json_required(j, "tools", p.tools);
  from_json_optional(j, "nextCursor", p.nextCursor);
}

// Call Tool Request
void to_json(nlohmann::json& j, const CallToolParams& p) {
  to_json_required(j, "name", p.name);
  to_json_optional(j, "arguments", p.arguments);
}

void from_json(const nlohmann::json& j, CallToolParams& p) {
  from_json_required(j, "name", p.name);
  if (j.contains("arguments") && !j["arguments"].is_null()) {
    p.arguments = j["arguments"];
  }
}

void to_json(nlohmann::json& j, const CallToolResult& p) {
  to_json_required(j, "content", p.content);
  to_json_optional(j, "structuredContent", p.structuredContent);
  to_json_required(j, "isError", p.isError);
}

void from_json(const nlohmann::json& j, CallToolResult& p) {
  from_json_required(j, "content", p.content);
  if (j.contains("structuredContent")) {
    p.structuredContent = j["structuredContent"];
  }
  if (j.contains("isError")) {
    j["isError"].get_to(p.isError);
  }
}

}  // namespace mcp
