#include "elm_mcp/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <string>

namespace elm_mcp {

inline auto HasExtension(
    std::filesystem::path path, std::initializer_list<std::string_view> exts)
    -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return std::ranges::find(exts, ext) != exts.end();
}

auto IsElmFile(std::filesystem::path path) -> bool {
  return HasExtension(path, {".elm"});
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  try {
    // Only canonicalize if the file actually exists
    // For synthetic/test files, just return the path as-is
    if (std::filesystem::exists(path)) {
      return std::filesystem::canonical(path);
    }
    return path.lexically_normal();
  } catch (const std::filesystem::filesystem_error&) {
    return path.lexically_normal();
  }
}

auto ResolveWithinRoot(
    const std::filesystem::path& root, std::string_view relative)
    -> std::filesystem::path {
  std::filesystem::path rel(relative);
  if (rel.empty() || rel.is_absolute()) {
    return {};
  }

  auto joined = (root / rel).lexically_normal();
  auto back = joined.lexically_relative(root);
  if (back.empty() || *back.begin() == "..") {
    return {};
  }
  return joined;
}

}  // namespace elm_mcp
