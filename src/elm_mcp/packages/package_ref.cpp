#include "elm_mcp/packages/package_ref.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

#include "mcp/json_utils.hpp"

namespace elm_mcp::packages {

namespace {

auto ParseComponent(std::string_view text) -> std::optional<int> {
  if (text.empty() || text.size() > 9 ||
      !std::ranges::all_of(text, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

auto IsNameChar(char c, bool allow_dot) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
         c == '_' || (allow_dot && c == '.');
}

}  // namespace

auto Version::Parse(std::string_view text) -> std::optional<Version> {
  auto first_dot = text.find('.');
  if (first_dot == std::string_view::npos) {
    return std::nullopt;
  }
  auto second_dot = text.find('.', first_dot + 1);
  if (second_dot == std::string_view::npos) {
    return std::nullopt;
  }

  auto major = ParseComponent(text.substr(0, first_dot));
  auto minor =
      ParseComponent(text.substr(first_dot + 1, second_dot - first_dot - 1));
  auto patch = ParseComponent(text.substr(second_dot + 1));
  if (!major || !minor || !patch) {
    return std::nullopt;
  }
  return Version{.major = *major, .minor = *minor, .patch = *patch};
}

auto Version::ToString() const -> std::string {
  return fmt::format("{}.{}.{}", major, minor, patch);
}

void to_json(nlohmann::json& j, const Version& v) {
  j = v.ToString();
}

void from_json(const nlohmann::json& j, Version& v) {
  auto parsed = Version::Parse(j.get<std::string>());
  if (!parsed) {
    throw std::runtime_error("Invalid version: " + j.dump());
  }
  v = *parsed;
}

auto PackageRef::FullName() const -> std::string {
  return author + "/" + name;
}

auto PackageRef::Parse(std::string_view text) -> std::optional<PackageRef> {
  std::optional<Version> version;
  if (auto at = text.find('@'); at != std::string_view::npos) {
    version = Version::Parse(text.substr(at + 1));
    if (!version) {
      return std::nullopt;
    }
    text = text.substr(0, at);
  }

  auto slash = text.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }
  auto author = text.substr(0, slash);
  auto name = text.substr(slash + 1);
  if (!IsValidAuthor(author) || !IsValidPackageName(name)) {
    return std::nullopt;
  }
  return PackageRef{
      .author = std::string(author),
      .name = std::string(name),
      .version = version,
  };
}

void to_json(nlohmann::json& j, const PackageRef& p) {
  mcp::to_json_required(j, "author", p.author);
  mcp::to_json_required(j, "name", p.name);
  mcp::to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, PackageRef& p) {
  mcp::from_json_required(j, "author", p.author);
  mcp::from_json_required(j, "name", p.name);
  mcp::from_json_optional(j, "version", p.version);
}

auto IsValidAuthor(std::string_view author) -> bool {
  if (author.empty() || author.front() == '-') {
    return false;
  }
  return std::ranges::all_of(
      author, [](char c) { return IsNameChar(c, false); });
}

auto IsValidPackageName(std::string_view name) -> bool {
  if (name.empty() || name.front() == '-' || name.front() == '.') {
    return false;
  }
  return std::ranges::all_of(name, [](char c) { return IsNameChar(c, true); });
}

}  // namespace elm_mcp::packages
