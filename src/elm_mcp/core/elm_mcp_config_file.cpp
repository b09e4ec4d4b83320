#include "elm_mcp/core/elm_mcp_config_file.hpp"

#include <yaml-cpp/yaml.h>

namespace elm_mcp {

namespace {

// Reads node[key] as T; logs and keeps nullopt when it has the wrong shape
template <typename T>
auto ReadScalar(
    const YAML::Node& node, const char* section, const char* key,
    spdlog::logger& logger) -> std::optional<T> {
  const auto value = node[key];
  if (!value) {
    return std::nullopt;
  }
  try {
    return value.as<T>();
  } catch (const YAML::BadConversion& e) {
    logger.warn("Ignoring {}.{} in {}: {}", section, key, kConfigFileName, e.what());
    return std::nullopt;
  }
}

auto ReadSeconds(
    const YAML::Node& node, const char* section, const char* key,
    spdlog::logger& logger) -> std::optional<std::chrono::seconds> {
  auto seconds = ReadScalar<long long>(node, section, key, logger);
  if (!seconds) {
    return std::nullopt;
  }
  if (*seconds <= 0) {
    logger.warn("Ignoring {}.{}: must be a positive number of seconds", section, key);
    return std::nullopt;
  }
  return std::chrono::seconds(*seconds);
}

}  // namespace

ElmMcpConfigFile::ElmMcpConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ElmMcpConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<ElmMcpConfigFile> {
  ElmMcpConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug("No {} found at {}", kConfigFileName, config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());
    auto& log = *config.logger_;

    if (const auto compiler = yaml["Compiler"]) {
      config.compiler_.command =
          ReadScalar<std::string>(compiler, "Compiler", "Command", log);
      config.compiler_.args =
          ReadScalar<std::vector<std::string>>(compiler, "Compiler", "Args", log);
      if (auto format =
              ReadScalar<std::string>(compiler, "Compiler", "Format", log)) {
        config.compiler_.format = diagnostics::ParseDiagnosticFormat(*format);
        if (!config.compiler_.format) {
          log.warn("Ignoring unknown Compiler.Format '{}'", *format);
        }
      }
      config.compiler_.timeout =
          ReadSeconds(compiler, "Compiler", "TimeoutSeconds", log);
    }

    if (const auto tool = yaml["ManifestTool"]) {
      config.manifest_tool_.command =
          ReadScalar<std::string>(tool, "ManifestTool", "Command", log);
      config.manifest_tool_.timeout =
          ReadSeconds(tool, "ManifestTool", "TimeoutSeconds", log);
    }

    if (const auto registry = yaml["Registry"]) {
      config.registry_.url =
          ReadScalar<std::string>(registry, "Registry", "Url", log);
      config.registry_.timeout =
          ReadSeconds(registry, "Registry", "TimeoutSeconds", log);
      config.registry_.cache_entries =
          ReadScalar<std::size_t>(registry, "Registry", "CacheEntries", log);
      config.registry_.cache_ttl =
          ReadSeconds(registry, "Registry", "CacheTtlSeconds", log);
    }

    if (const auto calls = yaml["Calls"]) {
      config.calls_.deadline =
          ReadSeconds(calls, "Calls", "DeadlineSeconds", log);
    }

    config.logger_->debug("Loaded {} from {}", kConfigFileName, config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error("Error parsing {}: {}", kConfigFileName, e.what());
    return std::nullopt;
  }
}

}  // namespace elm_mcp
