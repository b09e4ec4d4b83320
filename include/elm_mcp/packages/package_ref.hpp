#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace elm_mcp::packages {

// MAJOR.MINOR.PATCH, the only version form the Elm registry publishes
struct Version {
  int major = 0;
  int minor = 0;
  int patch = 0;

  // Strict: three non-negative decimal components, nothing else
  static auto Parse(std::string_view text) -> std::optional<Version>;

  [[nodiscard]] auto ToString() const -> std::string;

  friend auto operator<=>(const Version&, const Version&) = default;
  friend auto operator==(const Version&, const Version&) -> bool = default;
};

void to_json(nlohmann::json& j, const Version& v);
void from_json(const nlohmann::json& j, Version& v);

struct PackageRef {
  std::string author;
  std::string name;
  std::optional<Version> version;

  // "author/name", the registry identity
  [[nodiscard]] auto FullName() const -> std::string;

  // Accepts "author/name" and "author/name@1.2.3"
  static auto Parse(std::string_view text) -> std::optional<PackageRef>;

  [[nodiscard]] auto WithVersion(Version v) const -> PackageRef {
    PackageRef copy = *this;
    copy.version = v;
    return copy;
  }

  friend auto operator==(const PackageRef&, const PackageRef&) -> bool =
      default;
};

void to_json(nlohmann::json& j, const PackageRef& p);
void from_json(const nlohmann::json& j, PackageRef& p);

// Author and package names as the registry allows them: letters, digits,
// '-' and '_' ('.' also for package names), not starting with '-'
[[nodiscard]] auto IsValidAuthor(std::string_view author) -> bool;
[[nodiscard]] auto IsValidPackageName(std::string_view name) -> bool;

}  // namespace elm_mcp::packages

template <>
struct fmt::formatter<elm_mcp::packages::Version> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const elm_mcp::packages::Version& v, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(v.ToString(), ctx);
  }
};

template <>
struct fmt::formatter<elm_mcp::packages::PackageRef>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const elm_mcp::packages::PackageRef& p, FormatContext& ctx) const {
    auto text = p.version ? fmt::format("{}@{}", p.FullName(), *p.version)
                          : p.FullName();
    return fmt::formatter<std::string>::format(text, ctx);
  }
};
