#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "elm_mcp/error/tool_error.hpp"
#include "elm_mcp/packages/package_ref.hpp"

namespace elm_mcp::tools {

enum class ToolName {
  kValidate,
  kAddPackage,
  kRemovePackage,
  kSearchPackages,
  kGetLatestPackageVersion,
  kGetDocs,
};

inline constexpr std::array kAllTools = {
    ToolName::kValidate,       ToolName::kAddPackage,
    ToolName::kRemovePackage,  ToolName::kSearchPackages,
    ToolName::kGetLatestPackageVersion, ToolName::kGetDocs,
};

auto ToolNameToString(ToolName name) -> std::string_view;
auto ParseToolName(std::string_view name) -> std::optional<ToolName>;

struct ValidateArgs {
  // Relative to the project folder; the configured entry file otherwise
  std::optional<std::string> entry_file;
};

struct AddPackageArgs {
  packages::PackageRef package;
  bool test = false;
};

struct RemovePackageArgs {
  // Any version given is ignored
  packages::PackageRef package;
  bool test = false;
};

struct SearchPackagesArgs {
  std::string query;
  std::optional<std::size_t> limit;
};

struct GetLatestPackageVersionArgs {
  std::string author;
  std::string name;
};

struct GetDocsArgs {
  packages::PackageRef package;
  std::optional<std::string> module;
  // Requires module
  std::optional<std::string> symbol;
};

using ToolArguments = std::variant<
    ValidateArgs, AddPackageArgs, RemovePackageArgs, SearchPackagesArgs,
    GetLatestPackageVersionArgs, GetDocsArgs>;

struct ToolRequest {
  ToolName name;
  ToolArguments arguments;
};

// Checks the name against the closed tool set and the arguments against that
// tool's shape. Unknown argument keys are ignored. Every failure is
// kInvalidArguments.
auto ParseToolRequest(std::string_view name, const nlohmann::json& arguments)
    -> std::expected<ToolRequest, ToolError>;

}  // namespace elm_mcp::tools

template <>
struct fmt::formatter<elm_mcp::tools::ToolName>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const elm_mcp::tools::ToolName& name, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        elm_mcp::tools::ToolNameToString(name), ctx);
  }
};
