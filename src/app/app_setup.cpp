#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr std::string_view kFileLogPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%L] %v";
constexpr std::string_view kServerLoggerName = "elm_mcp";

struct LoggerConfig {
  std::string_view name;
  // Floor for the library loggers; SPDLOG_LEVEL can only raise it
  spdlog::level::level_enum floor;
};

auto ParseLogLevel(std::string_view level) -> spdlog::level::level_enum {
  auto parsed = spdlog::level::from_str(std::string(level));
  // from_str answers "off" for names it does not know
  if (parsed == spdlog::level::off && level != "off") {
    return spdlog::level::debug;
  }
  return parsed;
}

auto EnvOr(const char* name, std::string_view fallback) -> std::string {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? std::string(value)
                                              : std::string(fallback);
}

// Every logger writes to stderr; stdout carries the protocol over stdio.
// ELM_MCP_LOG_FILE adds a timestamped copy on disk.
auto BuildSinks() -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern(std::string(kLogPattern));
  sinks.push_back(std::move(console));

  if (auto path = EnvOr("ELM_MCP_LOG_FILE", ""); !path.empty()) {
    try {
      auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
      file->set_pattern(std::string(kFileLogPattern));
      sinks.push_back(std::move(file));
    } catch (const spdlog::spdlog_ex& e) {
      fmt::print(stderr, "Cannot open ELM_MCP_LOG_FILE {}: {}\n", path, e.what());
    }
  }
  return sinks;
}

}  // namespace

auto SetupLoggers() -> LoggerMap {
  const auto user_level = ParseLogLevel(EnvOr("SPDLOG_LEVEL", kDefaultLogLevel));
  spdlog::set_level(user_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .floor = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .floor = spdlog::level::info},
      LoggerConfig{.name = kServerLoggerName, .floor = spdlog::level::trace},
  };

  const auto sinks = BuildSinks();
  LoggerMap loggers;
  for (const auto& config : kLoggerConfigs) {
    auto logger = std::make_shared<spdlog::logger>(
        std::string(config.name), sinks.begin(), sinks.end());
    logger->set_level(std::max(config.floor, user_level));
    logger->flush_on(spdlog::level::info);
    spdlog::register_logger(logger);
    loggers[std::string(config.name)] = std::move(logger);
  }

  spdlog::set_default_logger(loggers[std::string(kServerLoggerName)]);
  return loggers;
}

}  // namespace app
