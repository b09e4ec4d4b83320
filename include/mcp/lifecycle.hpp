#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mcp/basic.hpp"

namespace mcp {

// Initialize Request
struct InitializeParams {
  std::string protocolVersion;
  nlohmann::json capabilities = nlohmann::json::object();
  Implementation clientInfo;
};

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

struct ServerCapabilities {
  struct ToolsCapability {
    std::optional<bool> listChanged;
  };
  std::optional<ToolsCapability> tools;
  std::optional<nlohmann::json> logging;
};

void to_json(nlohmann::json& j, const ServerCapabilities::ToolsCapability& p);
void from_json(const nlohmann::json& j, ServerCapabilities::ToolsCapability& p);

void to_json(nlohmann::json& j, const ServerCapabilities& p);
void from_json(const nlohmann::json& j, ServerCapabilities& p);

struct InitializeResult {
  std::string protocolVersion;
  ServerCapabilities capabilities;
  Implementation serverInfo;
  std::optional<std::string> instructions;
};

void to_json(nlohmann::json& j, const InitializeResult& p);
void from_json(const nlohmann::json& j, InitializeResult& p);

// Initialized Notification
struct InitializedParams {};

void to_json(nlohmann::json& j, const InitializedParams& p);
void from_json(const nlohmann::json& j, InitializedParams& p);

// Ping Request
struct PingParams {};

void to_json(nlohmann::json& j, const PingParams& p);
void from_json(const nlohmann::json& j, PingParams& p);

struct PingResult {};

void to_json(nlohmann::json& j, const PingResult& p);
void from_json(const nlohmann::json& j, PingResult& p);

// Cancelled Notification
struct CancelledParams {
  nlohmann::json requestId;
  std::optional<std::string> reason;
};

void to_json(nlohmann::json& j, const CancelledParams& p);
void from_json(const nlohmann::json& j, CancelledParams& p);

}  // namespace mcp
