#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcp/basic.hpp"

namespace mcp {

struct Tool {
  std::string name;
  std::optional<std::string> title;
  std::string description;
  nlohmann::json inputSchema = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Tool& p);
void from_json(const nlohmann::json& j, Tool& p);

// List Tools Request
struct ListToolsParams {
  std::optional<std::string> cursor;
};

void to_json(nlohmann::json& j, const ListToolsParams& p);
void from_json(const nlohmann::json& j, ListToolsParams& p);

struct ListToolsResult {
  std::vector<Tool> tools;
  std::optional<std::string> nextCursor;
};

void to_json(nlohmann::json& j, const ListToolsResult& p);
void from_json(const nlohmann::json& j, ListToolsResult& p);

// Call Tool Request
struct CallToolParams {
  std::string name;
  std::optional<nlohmann::json> arguments;
};

void to_json(nlohmann::json& j, const CallToolParams& p);
void from_json(const nlohmann::json& j, CallToolParams& p);

struct CallToolResult {
  std::vector<TextContent> content;
  std::optional<nlohmann::json> structuredContent;
  bool isError = false;
};

void to_json(nlohmann::json& j, const CallToolResult& p);
void from_json(const nlohmann::json& j, CallToolResult& p);

}  // namespace mcp
