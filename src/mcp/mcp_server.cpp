#include "mcp/mcp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mcp {

McpServer::McpServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto McpServer::Start() -> asio::awaitable<std::expected<void, McpError>> {
  RegisterHandlers();

  auto result = co_await endpoint_->Start();
  if (result.has_value()) {
    Logger()->debug("McpServer endpoint started");
  } else {
    Logger()->error("McpServer endpoint error: {}", result.error().Message());
    co_return McpError::UnexpectedFromRpcError(result.error());
  }

  // Runs until the client disconnects or Shutdown is called
  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (shutdown_result.has_value()) {
    Logger()->debug("McpServer endpoint wait for shutdown completed");
  } else {
    Logger()->error(
        "McpServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return McpError::UnexpectedFromRpcError(shutdown_result.error());
  }

  work_guard_.reset();
  co_return Ok();
}

auto McpServer::Shutdown() -> asio::awaitable<std::expected<void, McpError>> {
  Logger()->debug("Server shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (result.has_value()) {
      Logger()->debug("McpServer endpoint shutdown");
    } else {
      Logger()->error(
          "McpServer endpoint shutdown error: {}", result.error().Message());
      co_return McpError::UnexpectedFromRpcError(result.error());
    }
  }

  work_guard_.reset();

  co_return Ok();
}

void McpServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterToolHandlers();
}

void McpServer::RegisterLifecycleHandlers() {
  // Initialize Request
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, McpError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  // Initialized Notification
  endpoint_->RegisterNotification<InitializedParams, McpError>(
      "notifications/initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  // Ping Request
  endpoint_->RegisterMethodCall<PingParams, PingResult, McpError>(
      "ping", [this](const PingParams& params) { return OnPing(params); });

  // Cancelled Notification
  endpoint_->RegisterNotification<CancelledParams, McpError>(
      "notifications/cancelled",
      [this](const CancelledParams& params) { return OnCancelled(params); });
}

void McpServer::RegisterToolHandlers() {
  // List Tools Request
  endpoint_->RegisterMethodCall<ListToolsParams, ListToolsResult, McpError>(
      "tools/list",
      [this](const ListToolsParams& params) { return OnListTools(params); });

  // Call Tool Request
  endpoint_->RegisterMethodCall<CallToolParams, CallToolResult, McpError>(
      "tools/call",
      [this](const CallToolParams& params) { return OnCallTool(params); });
}

}  // namespace mcp
