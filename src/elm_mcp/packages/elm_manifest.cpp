#include "elm_mcp/packages/elm_manifest.hpp"

#include <fstream>

#include <fmt/format.h>

#include "mcp/json_utils.hpp"

namespace elm_mcp::packages {

namespace {

// Reads {"author/name": "<version or constraint>"} into out
auto ReadSection(
    const nlohmann::json& section, bool test, bool direct, bool constraints,
    std::vector<ManifestDependency>& out) -> std::expected<void, ToolError> {
  if (!section.is_object()) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal, "elm.json dependency section is not an object");
  }
  for (const auto& [key, value] : section.items()) {
    auto ref = PackageRef::Parse(key);
    if (!ref || ref->version || !value.is_string()) {
      return ToolError::UnexpectedFromKind(
          ToolErrorKind::kInternal,
          fmt::format("elm.json has an invalid dependency entry '{}'", key));
    }
    auto text = value.get<std::string>();
    auto version = constraints ? ParseConstraintLowerBound(text)
                               : Version::Parse(text);
    if (!version) {
      return ToolError::UnexpectedFromKind(
          ToolErrorKind::kInternal,
          fmt::format("elm.json has an invalid version '{}' for {}", text, key));
    }
    out.push_back(ManifestDependency{
        .package = ref->WithVersion(*version),
        .test = test,
        .direct = direct,
    });
  }
  return Ok();
}

}  // namespace

auto ParseConstraintLowerBound(std::string_view constraint)
    -> std::optional<Version> {
  auto space = constraint.find(' ');
  if (space == std::string_view::npos) {
    return Version::Parse(constraint);
  }
  auto rest = constraint.substr(space + 1);
  // Elm only writes the inclusive-lower form
  if (!rest.starts_with("<= v")) {
    return std::nullopt;
  }
  return Version::Parse(constraint.substr(0, space));
}

auto ElmManifest::Load(const std::filesystem::path& project_root)
    -> std::expected<ElmManifest, ToolError> {
  auto path = project_root / kManifestFileName;
  std::ifstream file(path);
  if (!file) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound,
        fmt::format("No {} found in {}", kManifestFileName, project_root.string()));
  }

  auto document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal,
        fmt::format("{} is not valid JSON", path.string()));
  }
  return FromJson(document);
}

auto ElmManifest::FromJson(const nlohmann::json& document)
    -> std::expected<ElmManifest, ToolError> {
  if (!document.is_object()) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal, "elm.json is not an object");
  }

  ElmManifest manifest;
  auto type = mcp::string_or(document, "type");
  if (type == "application") {
    manifest.kind_ = ManifestKind::kApplication;
    for (bool test : {false, true}) {
      const char* section_name = test ? "test-dependencies" : "dependencies";
      if (!document.contains(section_name)) {
        continue;
      }
      const auto& section = document.at(section_name);
      if (!section.is_object()) {
        return ToolError::UnexpectedFromKind(
            ToolErrorKind::kInternal,
            fmt::format("elm.json '{}' is not an object", section_name));
      }
      for (bool direct : {true, false}) {
        const char* scope = direct ? "direct" : "indirect";
        if (!section.contains(scope)) {
          continue;
        }
        auto result = ReadSection(
            section.at(scope), test, direct, false, manifest.dependencies_);
        if (!result) {
          return std::unexpected(result.error());
        }
      }
    }
  } else if (type == "package") {
    manifest.kind_ = ManifestKind::kPackage;
    for (bool test : {false, true}) {
      const char* section_name = test ? "test-dependencies" : "dependencies";
      if (!document.contains(section_name)) {
        continue;
      }
      auto result = ReadSection(
          document.at(section_name), test, true, true, manifest.dependencies_);
      if (!result) {
        return std::unexpected(result.error());
      }
    }
  } else {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal,
        fmt::format("elm.json has unknown type '{}'", type));
  }

  return manifest;
}

auto ElmManifest::FindDirect(
    std::string_view author, std::string_view name, bool test) const
    -> std::optional<Version> {
  for (const auto& dep : dependencies_) {
    if (dep.direct && dep.test == test && dep.package.author == author &&
        dep.package.name == name) {
      return dep.package.version;
    }
  }
  return std::nullopt;
}

auto ElmManifest::FindAny(std::string_view author, std::string_view name) const
    -> std::optional<Version> {
  const ManifestDependency* best = nullptr;
  auto rank = [](const ManifestDependency& dep) {
    return (dep.direct ? 0 : 2) + (dep.test ? 1 : 0);
  };
  for (const auto& dep : dependencies_) {
    if (dep.package.author != author || dep.package.name != name) {
      continue;
    }
    if (best == nullptr || rank(dep) < rank(*best)) {
      best = &dep;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return best->package.version;
}

}  // namespace elm_mcp::packages
