#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace elm_mcp {

// An absolute, symlink-free path, used for the project folder the server is
// bound to. Paths that do not exist yet are only normalized lexically.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  auto Path() const -> const std::filesystem::path&;
  auto String() const -> const std::string&;

  auto IsDirectory() const -> bool;

  // `path` relative to this directory, or nullopt unless it lies strictly
  // inside.
  // Relative input is taken as relative to this directory already.
  auto RelativeInside(const std::filesystem::path& path) const
      -> std::optional<std::filesystem::path>;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.string_ == rhs.string_;
  }

  auto operator/(std::filesystem::path rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace elm_mcp

template <>
struct fmt::formatter<elm_mcp::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const elm_mcp::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};
