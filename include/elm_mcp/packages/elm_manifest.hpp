#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "elm_mcp/error/tool_error.hpp"
#include "elm_mcp/packages/package_ref.hpp"

namespace elm_mcp::packages {

inline constexpr std::string_view kManifestFileName = "elm.json";

enum class ManifestKind {
  kApplication,
  kPackage,
};

struct ManifestDependency {
  // Version is always set: exact for applications, the constraint's lower
  // bound for packages
  PackageRef package;
  bool test = false;
  // Packages have no indirect section, all their entries are direct
  bool direct = true;
};

// Read-only view of a project's elm.json. The file is only ever written by
// the manifest tool; this class re-reads it after each change.
class ElmManifest {
 public:
  static auto Load(const std::filesystem::path& project_root)
      -> std::expected<ElmManifest, ToolError>;

  static auto FromJson(const nlohmann::json& document)
      -> std::expected<ElmManifest, ToolError>;

  [[nodiscard]] auto Kind() const -> ManifestKind {
    return kind_;
  }

  [[nodiscard]] auto Dependencies() const
      -> const std::vector<ManifestDependency>& {
    return dependencies_;
  }

  // Version of a direct dependency in the given section
  [[nodiscard]] auto FindDirect(
      std::string_view author, std::string_view name, bool test) const
      -> std::optional<Version>;

  // Any recorded version, preferring direct over indirect and normal over
  // test dependencies
  [[nodiscard]] auto FindAny(std::string_view author, std::string_view name)
      const -> std::optional<Version>;

 private:
  ElmManifest() = default;

  ManifestKind kind_ = ManifestKind::kApplication;
  std::vector<ManifestDependency> dependencies_;
};

// "1.0.0 <= v < 2.0.0" -> 1.0.0; a bare exact version is accepted as well
auto ParseConstraintLowerBound(std::string_view constraint)
    -> std::optional<Version>;

}  // namespace elm_mcp::packages
