#include "mcp/basic.hpp"

#include "mcp/json_utils.hpp"

namespace mcp {

void to_json(nlohmann::json& j, const Implementation& i) {
  to_json_required(j, "name", i.name);
  to_json_required(j, "version", i.version);
  to_json_optional(j, "title", i.title);
}

void from_json(const nlohmann::json& j, Implementation& i) {
  from_json_required(j, "name", i.name);
  from_json_required(j, "version", i.version);
  from_json_optional(j, "title", i.title);
}

void to_json(nlohmann::json& j, const TextContent& c) {
  to_json_required(j, "type", c.type);
  to_json_required(j, "text", c.text);
}

void from_json(const nlohmann::json& j, TextContent& c) {
  from_json_required(j, "type", c.type);
  from_json_required(j, "text", c.text);
}

}  // namespace mcp
