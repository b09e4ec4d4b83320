#include "elm_mcp/tools/tool_catalog.hpp"

namespace elm_mcp::tools {

namespace {

auto StringProperty(std::string description) -> nlohmann::json {
  return {{"type", "string"}, {"description", std::move(description)}};
}

auto VersionProperty(std::string description) -> nlohmann::json {
  return {
      {"type", "string"},
      {"pattern", "^[0-9]+\\.[0-9]+\\.[0-9]+$"},
      {"description", std::move(description)},
  };
}

auto ObjectSchema(nlohmann::json properties, std::vector<std::string> required)
    -> nlohmann::json {
  nlohmann::json schema{
      {"type", "object"},
      {"properties", std::move(properties)},
  };
  if (!required.empty()) {
    schema["required"] = std::move(required);
  }
  return schema;
}

auto BuildCatalog() -> std::vector<ToolDescriptor> {
  const auto author = StringProperty("Package author, e.g. \"elm\"");
  const auto name = StringProperty("Package name, e.g. \"json\"");
  const auto test = nlohmann::json{
      {"type", "boolean"},
      {"description", "Use test-dependencies instead of dependencies"},
  };

  std::vector<ToolDescriptor> catalog;
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kValidate,
      .description =
          "Compiles the project and returns the compiler's diagnostics, "
          "ordered by file and position. An empty list means the project "
          "compiles.",
      .input_schema = ObjectSchema(
          {{"entry_file",
            StringProperty(
                "Entry module relative to the project folder "
                "(default src/Main.elm)")}},
          {}),
  });
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kAddPackage,
      .description =
          "Adds <AUTHOR>/<NAME> to elm.json, at the given version or the "
          "newest compatible one. Succeeds without changes when the package "
          "is already a direct dependency at that version.",
      .input_schema = ObjectSchema(
          {{"author", author},
           {"name", name},
           {"version", VersionProperty("Exact version to install")},
           {"test", test}},
          {"author", "name"}),
  });
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kRemovePackage,
      .description = "Removes the direct dependency <AUTHOR>/<NAME> from elm.json",
      .input_schema = ObjectSchema(
          {{"author", author},
           {"name", name},
           {"version", VersionProperty("Ignored")},
           {"test", test}},
          {"author", "name"}),
  });
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kSearchPackages,
      .description =
          "Searches the Elm package registry by name and summary. An empty "
          "query lists every available package.",
      .input_schema = ObjectSchema(
          {{"query",
            StringProperty("Case-insensitive text to look for")},
           {"limit",
            {{"type", "integer"},
             {"minimum", 1},
             {"description", "Maximum number of results"}}}},
          {}),
  });
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kGetLatestPackageVersion,
      .description =
          "Gets the latest available package version for <AUTHOR>/<NAME>",
      .input_schema =
          ObjectSchema({{"author", author}, {"name", name}}, {"author", "name"}),
  });
  catalog.push_back(ToolDescriptor{
      .name = ToolName::kGetDocs,
      .description =
          "Gets the docs for a specified Elm package, optionally narrowed to "
          "one module or one symbol of a module. Without a version, the one "
          "in elm.json is used, then the latest.",
      .input_schema = ObjectSchema(
          {{"author", author},
           {"name", name},
           {"version", VersionProperty("Package version")},
           {"module", StringProperty("Module name, e.g. \"Json.Decode\"")},
           {"symbol",
            StringProperty("Value, type, alias or operator in the module")}},
          {"author", "name"}),
  });
  return catalog;
}

}  // namespace

auto ToolCatalog() -> const std::vector<ToolDescriptor>& {
  static const std::vector<ToolDescriptor> kCatalog = BuildCatalog();
  return kCatalog;
}

}  // namespace elm_mcp::tools
