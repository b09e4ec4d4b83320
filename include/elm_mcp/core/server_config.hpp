#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "elm_mcp/packages/package_operations.hpp"
#include "elm_mcp/tools/tool_dispatcher.hpp"
#include "elm_mcp/utils/canonical_path.hpp"

namespace elm_mcp {

struct RegistryOptions {
  std::string url = "https://package.elm-lang.org";
  std::chrono::milliseconds timeout = std::chrono::seconds(15);
  std::size_t cache_entries = 256;
  std::chrono::seconds cache_ttl = std::chrono::seconds(300);
};

// Everything the server needs to start, resolved once at startup.
//
// Environment: PROJECT_FOLDER (required), PORT, ENTRY_FILE, ELM_HOME, HOME.
// The project's .elm-mcp.yaml refines the tool settings.
struct ServerConfig {
  using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

  CanonicalPath project_folder;
  // Serve over TCP on 127.0.0.1 instead of stdio
  std::optional<std::uint16_t> port;
  std::filesystem::path elm_home;

  tools::CompilerOptions compiler;
  packages::ManifestToolOptions manifest_tool;
  RegistryOptions registry;
  std::chrono::milliseconds call_deadline = std::chrono::seconds(180);

  static auto Load(
      const EnvLookup& env, std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::expected<ServerConfig, std::string>;

  // Reads the process environment
  static auto ProcessEnvironment() -> EnvLookup;
};

}  // namespace elm_mcp
