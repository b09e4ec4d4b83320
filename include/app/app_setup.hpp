#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include <spdlog/logger.h>

namespace app {

using LoggerMap =
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

/// Create the named loggers (transport, jsonrpc, elm_mcp) on stderr, plus
/// ELM_MCP_LOG_FILE when set. SPDLOG_LEVEL sets the elm_mcp level and the
/// global level; transport and jsonrpc stay at info unless it is stricter.
auto SetupLoggers() -> LoggerMap;

}  // namespace app
