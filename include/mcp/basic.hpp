#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp {

// Name and version of a client or server
struct Implementation {
  std::string name;
  std::string version;
  std::optional<std::string> title;
};

void to_json(nlohmann::json& j, const Implementation& i);
void from_json(const nlohmann::json& j, Implementation& i);

// The only content block this server emits
struct TextContent {
  std::string type = "text";
  std::string text;
};

void to_json(nlohmann::json& j, const TextContent& c);
void from_json(const nlohmann::json& j, TextContent& c);

}  // namespace mcp
