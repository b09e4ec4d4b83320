#pragma once

#include <filesystem>
#include <string_view>

namespace elm_mcp {

[[nodiscard]] auto IsElmFile(std::filesystem::path path) -> bool;

// Lexically normalizes, then canonicalizes when the path exists
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// Resolves a caller-supplied relative path against root. Returns an empty
// path if the result would escape root.
[[nodiscard]] auto ResolveWithinRoot(
    const std::filesystem::path& root, std::string_view relative)
    -> std::filesystem::path;

}  // namespace elm_mcp
