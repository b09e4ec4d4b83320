#include "elm_mcp/utils/canonical_path.hpp"

#include "elm_mcp/utils/path_utils.hpp"

namespace elm_mcp {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))), string_(path_.string()) {
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  return string_;
}

auto CanonicalPath::IsDirectory() const -> bool {
  std::error_code ec;
  return std::filesystem::is_directory(path_, ec);
}

auto CanonicalPath::RelativeInside(const std::filesystem::path& path) const
    -> std::optional<std::filesystem::path> {
  auto absolute = path.is_absolute() ? path : path_ / path;
  auto relative = absolute.lexically_normal().lexically_relative(path_);
  if (relative.empty() || relative == "." || *relative.begin() == "..") {
    return std::nullopt;
  }
  return relative;
}

auto CanonicalPath::operator/(std::filesystem::path rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace elm_mcp
