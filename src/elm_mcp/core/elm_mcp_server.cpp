#include "elm_mcp/core/elm_mcp_server.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "elm_mcp/tools/tool_catalog.hpp"

namespace elm_mcp {

using mcp::McpError;
using mcp::Ok;

namespace {

constexpr std::string_view kServerName = "elm-mcp";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kInstructions =
    "Tools for the Elm project in PROJECT_FOLDER: compile it, manage its "
    "dependencies and look up package documentation.";

}  // namespace

ElmMcpServer::ElmMcpServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<tools::ToolDispatcher> dispatcher,
    std::shared_ptr<spdlog::logger> logger)
    : mcp::McpServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      dispatcher_(std::move(dispatcher)) {
}

auto ElmMcpServer::NegotiateProtocolVersion(std::string_view requested)
    -> std::string {
  auto it = std::ranges::find(kSupportedProtocolVersions, requested);
  if (it != kSupportedProtocolVersions.end()) {
    return std::string(*it);
  }
  return std::string(kSupportedProtocolVersions.front());
}

auto ElmMcpServer::BuildToolList() -> mcp::ListToolsResult {
  mcp::ListToolsResult result;
  for (const auto& descriptor : tools::ToolCatalog()) {
    result.tools.push_back(
        mcp::Tool{
            .name = std::string(tools::ToolNameToString(descriptor.name)),
            .title = std::nullopt,
            .description = descriptor.description,
            .inputSchema = descriptor.input_schema,
        });
  }
  return result;
}

auto ElmMcpServer::ToCallToolResult(const tools::ToolResult& result)
    -> mcp::CallToolResult {
  auto structured = tools::ToolResultToJson(result);
  mcp::CallToolResult shaped;
  shaped.content.push_back(mcp::TextContent{.text = structured.dump()});
  shaped.structuredContent = std::move(structured);
  shaped.isError = !result.has_value();
  return shaped;
}

auto ElmMcpServer::OnInitialize(mcp::InitializeParams params)
    -> asio::awaitable<std::expected<mcp::InitializeResult, McpError>> {
  auto version = NegotiateProtocolVersion(params.protocolVersion);
  logger_->info(
      "ElmMcpServer initializing for {} (protocol {}, negotiated {})",
      params.clientInfo.name.empty() ? "unknown client"
                                     : params.clientInfo.name,
      params.protocolVersion, version);

  mcp::InitializeResult result{
      .protocolVersion = std::move(version),
      .capabilities =
          mcp::ServerCapabilities{
              .tools =
                  mcp::ServerCapabilities::ToolsCapability{
                      .listChanged = false},
              .logging = std::nullopt,
          },
      .serverInfo =
          mcp::Implementation{
              .name = std::string(kServerName),
              .version = std::string(kServerVersion),
              .title = std::nullopt,
          },
      .instructions = std::string(kInstructions),
  };
  co_return result;
}

auto ElmMcpServer::OnInitialized(mcp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, McpError>> {
  initialized_ = true;
  logger_->debug("ElmMcpServer initialized");
  co_return Ok();
}

auto ElmMcpServer::OnCancelled(mcp::CancelledParams params)
    -> asio::awaitable<std::expected<void, McpError>> {
  // Handlers are not given their request id, so the call cannot be located.
  // The call still ends at its own deadline.
  logger_->debug(
      "ElmMcpServer ignoring cancellation of request {}{}",
      params.requestId.dump(),
      params.reason ? fmt::format(" ({})", *params.reason) : "");
  co_return Ok();
}

auto ElmMcpServer::OnListTools(mcp::ListToolsParams /*unused*/)
    -> asio::awaitable<std::expected<mcp::ListToolsResult, McpError>> {
  co_return BuildToolList();
}

auto ElmMcpServer::OnCallTool(mcp::CallToolParams params)
    -> asio::awaitable<std::expected<mcp::CallToolResult, McpError>> {
  if (!initialized_) {
    logger_->debug(
        "ElmMcpServer received tools/call for '{}' before initialized",
        params.name);
  }

  auto arguments = params.arguments.value_or(nlohmann::json::object());
  auto result = co_await dispatcher_->Dispatch(params.name, arguments);
  if (!result) {
    logger_->debug(
        "ElmMcpServer tool '{}' failed: {}", params.name,
        result.error().Message());
  }
  co_return ToCallToolResult(result);
}

}  // namespace elm_mcp
