#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "elm_mcp/tools/tool_request.hpp"

namespace elm_mcp::tools {

struct ToolDescriptor {
  ToolName name;
  std::string description;
  // JSON Schema of the arguments object
  nlohmann::json input_schema;
};

// One descriptor per ToolName, in declaration order
auto ToolCatalog() -> const std::vector<ToolDescriptor>&;

}  // namespace elm_mcp::tools
