#include "mcp/lifecycle.hpp"

#include "mcp/json_utils.hpp"

namespace mcp {

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams& p) {
  to_json_required(j, "protocolVersion", p.protocolVersion);
  to_json_required(j, "capabilities", p.capabilities);
  to_json_required(j, "clientInfo", p.clientInfo);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json_required(j, "protocolVersion", p.protocolVersion);
  if (j.contains("capabilities") && j["capabilities"].is_object()) {
    p.capabilities = j["capabilities"];
  }
  // Some clients omit clientInfo; it is informational only
  if (j.contains("clientInfo") && j["clientInfo"].is_object()) {
    from_json_required(j, "clientInfo", p.clientInfo);
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities::ToolsCapability& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "listChanged", p.listChanged);
}

void from_json(
    const nlohmann::json& j, ServerCapabilities::ToolsCapability& p) {
  from_json_optional(j, "listChanged", p.listChanged);
}

void to_json(nlohmann::json& j, const ServerCapabilities& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "tools", p.tools);
  to_json_optional(j, "logging", p.logging);
}

void from_json(const nlohmann::json& j, ServerCapabilities& p) {
  from_json_optional(j, "tools", p.tools);
  from_json_optional(j, "logging", p.logging);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  to_json_required(j, "protocolVersion", p.protocolVersion);
  to_json_required(j, "capabilities", p.capabilities);
  to_json_required(j, "serverInfo", p.serverInfo);
  to_json_optional(j, "instructions", p.instructions);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  from_json_required(j, "protocolVersion", p.protocolVersion);
  from_json_required(j, "capabilities", p.capabilities);
  from_json_required(j, "serverInfo", p.serverInfo);
  from_json_optional(j, "instructions", p.instructions);
}

// Initialized Notification
void to_json(nlohmann::json& j, const InitializedParams&) {
  j = nlohmann::json::object();
}
void from_json(const nlohmann::json&, InitializedParams&) {}

// Ping Request
void to_json(nlohmann::json& j, const PingParams&) {
  j = nlohmann::json::object();
}
void from_json(const nlohmann::json&, PingParams&) {}

void to_json(nlohmann::json& j, const PingResult&) {
  j = nlohmann::json::object();
}
void from_json(const nlohmann::json&, PingResult&) {}

// Cancelled Notification
void to_json(nlohmann::json& j, const CancelledParams& p) {
  to_json_required(j, "requestId", p.requestId);
  to_json_optional(j, "reason", p.reason);
}

void from_json(const nlohmann::json& j, CancelledParams& p) {
  if (j.contains("requestId")) {
    p.requestId = j["requestId"];
  }
  from_json_optional(j, "reason", p.reason);
}

}  // namespace mcp
