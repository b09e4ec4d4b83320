#include "elm_mcp/tools/tool_result.hpp"

#include "mcp/json_utils.hpp"

namespace elm_mcp::tools {

using mcp::to_json_required;

void to_json(nlohmann::json& j, const ValidateResult& r) {
  to_json_required(j, "diagnostics", r.diagnostics);
  to_json_required(j, "dropped_records", r.dropped_records);
}

void to_json(nlohmann::json& j, const RemovePackageResult& r) {
  to_json_required(j, "package", r.package);
}

void to_json(nlohmann::json& j, const SearchPackagesResult& r) {
  to_json_required(j, "packages", r.packages);
}

void to_json(nlohmann::json& j, const GetLatestPackageVersionResult& r) {
  to_json_required(j, "package", r.package);
}

auto PayloadToJson(const ToolPayload& payload) -> nlohmann::json {
  return std::visit(
      [](const auto& value) -> nlohmann::json { return value; }, payload);
}

auto ToolResultToJson(const ToolResult& result) -> nlohmann::json {
  if (result) {
    return {{"result", PayloadToJson(*result)}};
  }
  return {{"error", result.error().ToJson()}};
}

}  // namespace elm_mcp::tools
