#include "elm_mcp/core/server_config.hpp"

#include <charconv>
#include <cstdlib>

#include "elm_mcp/core/elm_mcp_config_file.hpp"
#include "elm_mcp/utils/path_utils.hpp"

namespace elm_mcp {

namespace {

auto ParsePort(std::string_view text) -> std::optional<std::uint16_t> {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 ||
      value > 65535) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(value);
}

auto DefaultElmHome(const ServerConfig::EnvLookup& env)
    -> std::filesystem::path {
  if (auto elm_home = env("ELM_HOME"); elm_home && !elm_home->empty()) {
    return *elm_home;
  }
  if (auto home = env("HOME"); home && !home->empty()) {
    return std::filesystem::path(*home) / ".elm";
  }
  return {};
}

void ApplyConfigFile(ServerConfig& config, const ElmMcpConfigFile& file) {
  const auto& compiler = file.GetCompiler();
  if (compiler.command) {
    config.compiler.command = *compiler.command;
  }
  if (compiler.args) {
    config.compiler.args = *compiler.args;
  }
  if (compiler.format) {
    config.compiler.format = *compiler.format;
  }
  if (compiler.timeout) {
    config.compiler.timeout = *compiler.timeout;
  }

  const auto& tool = file.GetManifestTool();
  if (tool.command) {
    config.manifest_tool.command = *tool.command;
  }
  if (tool.timeout) {
    config.manifest_tool.timeout = *tool.timeout;
  }

  const auto& registry = file.GetRegistry();
  if (registry.url) {
    config.registry.url = *registry.url;
  }
  if (registry.timeout) {
    config.registry.timeout = *registry.timeout;
  }
  if (registry.cache_entries) {
    config.registry.cache_entries = *registry.cache_entries;
  }
  if (registry.cache_ttl) {
    config.registry.cache_ttl = *registry.cache_ttl;
  }

  if (file.GetCalls().deadline) {
    config.call_deadline = *file.GetCalls().deadline;
  }
}

}  // namespace

auto ServerConfig::ProcessEnvironment() -> EnvLookup {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

auto ServerConfig::Load(
    const EnvLookup& env, std::shared_ptr<spdlog::logger> logger)
    -> std::expected<ServerConfig, std::string> {
  auto log = logger ? logger : spdlog::default_logger();
  ServerConfig config;

  auto folder = env("PROJECT_FOLDER");
  if (!folder || folder->empty()) {
    return std::unexpected("PROJECT_FOLDER is not set");
  }
  config.project_folder = CanonicalPath(NormalizePath(*folder));
  if (!config.project_folder.IsDirectory()) {
    return std::unexpected(
        fmt::format("PROJECT_FOLDER {} is not a directory", *folder));
  }

  if (auto port = env("PORT"); port && !port->empty()) {
    config.port = ParsePort(*port);
    if (!config.port) {
      return std::unexpected(fmt::format("PORT '{}' is not a valid port", *port));
    }
  }

  config.elm_home = DefaultElmHome(env);

  auto config_path = config.project_folder / std::string(kConfigFileName);
  if (auto file = ElmMcpConfigFile::LoadFromFile(config_path, log)) {
    ApplyConfigFile(config, *file);
  }

  // The environment wins over the file for the entry module
  if (auto entry = env("ENTRY_FILE"); entry && !entry->empty()) {
    auto relative = config.project_folder.RelativeInside(*entry);
    if (!relative) {
      return std::unexpected(
          fmt::format("ENTRY_FILE {} is outside PROJECT_FOLDER", *entry));
    }
    config.compiler.entry_file = relative->generic_string();
  }

  log->info(
      "Serving {} (entry {}, {})", config.project_folder,
      config.compiler.entry_file,
      config.port ? fmt::format("tcp 127.0.0.1:{}", *config.port) : "stdio");
  return config;
}

}  // namespace elm_mcp
