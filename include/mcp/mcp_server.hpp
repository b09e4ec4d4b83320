#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "mcp/error.hpp"
#include "mcp/lifecycle.hpp"
#include "mcp/tools.hpp"

namespace mcp {

using mcp::error::McpError;
using mcp::error::McpErrorCode;
using mcp::error::Ok;

// Model Context Protocol server skeleton. Binds the protocol methods to
// virtual handlers; derived servers override the ones they support.
class McpServer {
 public:
  McpServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  McpServer(const McpServer&) = delete;
  McpServer(McpServer&&) = delete;
  auto operator=(const McpServer&) -> McpServer& = delete;
  auto operator=(McpServer&&) -> McpServer& = delete;

  virtual ~McpServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, McpError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, McpError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  void RegisterHandlers();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;

  void RegisterLifecycleHandlers();
  void RegisterToolHandlers();

 protected:
  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, McpError>> {
    co_return McpError::UnexpectedFromCode(
        McpErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, McpError>> {
    co_return McpError::UnexpectedFromCode(
        McpErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Ping Request
  virtual auto OnPing(PingParams /*unused*/)
      -> asio::awaitable<std::expected<PingResult, McpError>> {
    co_return PingResult{};
  }

  // Cancelled Notification
  virtual auto OnCancelled(CancelledParams /*unused*/)
      -> asio::awaitable<std::expected<void, McpError>> {
    co_return Ok();
  }

  // List Tools Request
  virtual auto OnListTools(ListToolsParams /*unused*/)
      -> asio::awaitable<std::expected<ListToolsResult, McpError>> {
    co_return McpError::UnexpectedFromCode(
        McpErrorCode::kMethodNotImplemented, "OnListTools is not implemented");
  }

  // Call Tool Request
  virtual auto OnCallTool(CallToolParams /*unused*/)
      -> asio::awaitable<std::expected<CallToolResult, McpError>> {
    co_return McpError::UnexpectedFromCode(
        McpErrorCode::kMethodNotImplemented, "OnCallTool is not implemented");
  }
};

}  // namespace mcp
