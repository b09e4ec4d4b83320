#include "elm_mcp/tools/tool_request.hpp"

#include <algorithm>
#include <cstdint>

namespace elm_mcp::tools {

namespace {

constexpr std::array<std::pair<ToolName, std::string_view>, 6> kToolNames = {{
    {ToolName::kValidate, "validate"},
    {ToolName::kAddPackage, "add_package"},
    {ToolName::kRemovePackage, "remove_package"},
    {ToolName::kSearchPackages, "search_packages"},
    {ToolName::kGetLatestPackageVersion, "get_latest_package_version"},
    {ToolName::kGetDocs, "get_docs"},
}};

auto Invalid(std::string message) -> std::unexpected<ToolError> {
  return ToolError::UnexpectedFromKind(
      ToolErrorKind::kInvalidArguments, message);
}

// Reads one argument. Absent and null are both "not given".
class ArgumentReader {
 public:
  explicit ArgumentReader(const nlohmann::json& arguments)
      : arguments_(arguments) {
  }

  auto OptionalString(const std::string& key)
      -> std::expected<std::optional<std::string>, ToolError> {
    auto it = arguments_.find(key);
    if (it == arguments_.end() || it->is_null()) {
      return std::nullopt;
    }
    if (!it->is_string()) {
      return Invalid(fmt::format("'{}' must be a string", key));
    }
    return it->get<std::string>();
  }

  auto RequiredString(const std::string& key)
      -> std::expected<std::string, ToolError> {
    auto value = OptionalString(key);
    if (!value) {
      return std::unexpected(value.error());
    }
    if (!*value || (*value)->empty()) {
      return Invalid(fmt::format("'{}' is required", key));
    }
    return std::move(**value);
  }

  auto OptionalBool(const std::string& key, bool fallback)
      -> std::expected<bool, ToolError> {
    auto it = arguments_.find(key);
    if (it == arguments_.end() || it->is_null()) {
      return fallback;
    }
    if (!it->is_boolean()) {
      return Invalid(fmt::format("'{}' must be a boolean", key));
    }
    return it->get<bool>();
  }

  auto OptionalPositive(const std::string& key)
      -> std::expected<std::optional<std::size_t>, ToolError> {
    auto it = arguments_.find(key);
    if (it == arguments_.end() || it->is_null()) {
      return std::nullopt;
    }
    if (it->is_number_unsigned()) {
      auto value = it->get<std::uint64_t>();
      if (value > 0) {
        return static_cast<std::size_t>(value);
      }
    }
    return Invalid(fmt::format("'{}' must be a positive integer", key));
  }

  auto OptionalVersion(const std::string& key)
      -> std::expected<std::optional<packages::Version>, ToolError> {
    auto text = OptionalString(key);
    if (!text) {
      return std::unexpected(text.error());
    }
    if (!*text) {
      return std::nullopt;
    }
    auto version = packages::Version::Parse(**text);
    if (!version) {
      return Invalid(fmt::format(
          "'{}' must be a MAJOR.MINOR.PATCH version, got '{}'", key, **text));
    }
    return *version;
  }

  // author + name (+ version), checked against registry naming rules
  auto Package(bool with_version)
      -> std::expected<packages::PackageRef, ToolError> {
    auto author = RequiredString("author");
    if (!author) {
      return std::unexpected(author.error());
    }
    auto name = RequiredString("name");
    if (!name) {
      return std::unexpected(name.error());
    }
    if (!packages::IsValidAuthor(*author)) {
      return Invalid(fmt::format("'{}' is not a valid package author", *author));
    }
    if (!packages::IsValidPackageName(*name)) {
      return Invalid(fmt::format("'{}' is not a valid package name", *name));
    }
    packages::PackageRef ref{.author = std::move(*author), .name = std::move(*name)};
    if (with_version) {
      auto version = OptionalVersion("version");
      if (!version) {
        return std::unexpected(version.error());
      }
      ref.version = *version;
    }
    return ref;
  }

 private:
  const nlohmann::json& arguments_;
};

auto ParseValidate(ArgumentReader& reader)
    -> std::expected<ToolArguments, ToolError> {
  auto entry = reader.OptionalString("entry_file");
  if (!entry) {
    return std::unexpected(entry.error());
  }
  if (*entry && (*entry)->empty()) {
    return Invalid("'entry_file' must not be empty");
  }
  return ValidateArgs{.entry_file = std::move(*entry)};
}

template <typename Args>
auto ParseDependencyChange(ArgumentReader& reader, bool with_version)
    -> std::expected<ToolArguments, ToolError> {
  auto package = reader.Package(with_version);
  if (!package) {
    return std::unexpected(package.error());
  }
  auto test = reader.OptionalBool("test", false);
  if (!test) {
    return std::unexpected(test.error());
  }
  return Args{.package = std::move(*package), .test = *test};
}

auto ParseSearch(ArgumentReader& reader)
    -> std::expected<ToolArguments, ToolError> {
  auto query = reader.OptionalString("query");
  if (!query) {
    return std::unexpected(query.error());
  }
  auto limit = reader.OptionalPositive("limit");
  if (!limit) {
    return std::unexpected(limit.error());
  }
  return SearchPackagesArgs{
      .query = query->value_or(""),
      .limit = *limit,
  };
}

auto ParseLatest(ArgumentReader& reader)
    -> std::expected<ToolArguments, ToolError> {
  auto package = reader.Package(false);
  if (!package) {
    return std::unexpected(package.error());
  }
  return GetLatestPackageVersionArgs{
      .author = std::move(package->author),
      .name = std::move(package->name),
  };
}

auto ParseDocs(ArgumentReader& reader)
    -> std::expected<ToolArguments, ToolError> {
  auto package = reader.Package(true);
  if (!package) {
    return std::unexpected(package.error());
  }
  auto module = reader.OptionalString("module");
  if (!module) {
    return std::unexpected(module.error());
  }
  auto symbol = reader.OptionalString("symbol");
  if (!symbol) {
    return std::unexpected(symbol.error());
  }
  if (*symbol && !*module) {
    return Invalid("'symbol' requires 'module'");
  }
  return GetDocsArgs{
      .package = std::move(*package),
      .module = std::move(*module),
      .symbol = std::move(*symbol),
  };
}

}  // namespace

auto ToolNameToString(ToolName name) -> std::string_view {
  for (const auto& [tool, text] : kToolNames) {
    if (tool == name) {
      return text;
    }
  }
  return "unknown";
}

auto ParseToolName(std::string_view name) -> std::optional<ToolName> {
  auto it = std::ranges::find_if(
      kToolNames, [name](const auto& entry) { return entry.second == name; });
  if (it == kToolNames.end()) {
    return std::nullopt;
  }
  return it->first;
}

auto ParseToolRequest(std::string_view name, const nlohmann::json& arguments)
    -> std::expected<ToolRequest, ToolError> {
  auto tool = ParseToolName(name);
  if (!tool) {
    return Invalid(fmt::format("Unknown tool '{}'", name));
  }

  static const nlohmann::json kNoArguments = nlohmann::json::object();
  const auto& args = arguments.is_null() ? kNoArguments : arguments;
  if (!args.is_object()) {
    return Invalid("Tool arguments must be an object");
  }

  ArgumentReader reader(args);
  std::expected<ToolArguments, ToolError> parsed;
  switch (*tool) {
    case ToolName::kValidate:
      parsed = ParseValidate(reader);
      break;
    case ToolName::kAddPackage:
      parsed = ParseDependencyChange<AddPackageArgs>(reader, true);
      break;
    case ToolName::kRemovePackage:
      parsed = ParseDependencyChange<RemovePackageArgs>(reader, true);
      break;
    case ToolName::kSearchPackages:
      parsed = ParseSearch(reader);
      break;
    case ToolName::kGetLatestPackageVersion:
      parsed = ParseLatest(reader);
      break;
    case ToolName::kGetDocs:
      parsed = ParseDocs(reader);
      break;
  }
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  return ToolRequest{.name = *tool, .arguments = std::move(*parsed)};
}

}  // namespace elm_mcp::tools
