#pragma once

#include <array>
#include <memory>
#include <string>
#include <string_view>

#include <asio/awaitable.hpp>

#include "mcp/lifecycle.hpp"
#include "mcp/mcp_server.hpp"
#include "mcp/tools.hpp"
#include "elm_mcp/tools/tool_dispatcher.hpp"

namespace elm_mcp {

// Newest first
inline constexpr std::array<std::string_view, 3> kSupportedProtocolVersions = {
    "2025-06-18", "2025-03-26", "2024-11-05"};

class ElmMcpServer : public mcp::McpServer {
 public:
  ElmMcpServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<tools::ToolDispatcher> dispatcher,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Echoes the client's version when supported, the newest one otherwise
  static auto NegotiateProtocolVersion(std::string_view requested)
      -> std::string;

  static auto BuildToolList() -> mcp::ListToolsResult;

  // Structured result plus the same JSON as a single text block
  static auto ToCallToolResult(const tools::ToolResult& result)
      -> mcp::CallToolResult;

 private:
  bool initialized_ = false;

  std::shared_ptr<spdlog::logger> logger_;

  asio::any_io_executor executor_;

  std::shared_ptr<tools::ToolDispatcher> dispatcher_;

 protected:
  // Initialize Request
  auto OnInitialize(mcp::InitializeParams params) -> asio::awaitable<
      std::expected<mcp::InitializeResult, mcp::McpError>> override;

  // Initialized Notification
  auto OnInitialized(mcp::InitializedParams params)
      -> asio::awaitable<std::expected<void, mcp::McpError>> override;

  // Cancelled Notification
  auto OnCancelled(mcp::CancelledParams params)
      -> asio::awaitable<std::expected<void, mcp::McpError>> override;

  // List Tools Request
  auto OnListTools(mcp::ListToolsParams params) -> asio::awaitable<
      std::expected<mcp::ListToolsResult, mcp::McpError>> override;

  // Call Tool Request
  auto OnCallTool(mcp::CallToolParams params) -> asio::awaitable<
      std::expected<mcp::CallToolResult, mcp::McpError>> override;
};

}  // namespace elm_mcp
