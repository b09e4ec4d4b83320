#pragma once

#include <expected>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "elm_mcp/diagnostics/diagnostic.hpp"
#include "elm_mcp/error/tool_error.hpp"
#include "elm_mcp/packages/package_operations.hpp"
#include "elm_mcp/packages/package_ref.hpp"
#include "elm_mcp/registry/package_registry.hpp"

namespace elm_mcp::tools {

struct ValidateResult {
  std::vector<diagnostics::Diagnostic> diagnostics;
  int dropped_records = 0;
};

struct RemovePackageResult {
  packages::PackageRef package;
};

struct SearchPackagesResult {
  std::vector<registry::PackageSummary> packages;
};

struct GetLatestPackageVersionResult {
  packages::PackageRef package;
};

void to_json(nlohmann::json& j, const ValidateResult& r);
void to_json(nlohmann::json& j, const RemovePackageResult& r);
void to_json(nlohmann::json& j, const SearchPackagesResult& r);
void to_json(nlohmann::json& j, const GetLatestPackageVersionResult& r);

// One alternative per tool
using ToolPayload = std::variant<
    ValidateResult, packages::AddPackageResult, RemovePackageResult,
    SearchPackagesResult, GetLatestPackageVersionResult, packages::DocsResult>;

using ToolResult = std::expected<ToolPayload, ToolError>;

auto PayloadToJson(const ToolPayload& payload) -> nlohmann::json;

// {"result": payload} or {"error": {kind, message, tool, retryable}}
auto ToolResultToJson(const ToolResult& result) -> nlohmann::json;

}  // namespace elm_mcp::tools
