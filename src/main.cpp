#include <memory>
#include <string>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/socket_transport.hpp>
#include <jsonrpc/transport/stdio_transport.hpp>
#include <jsonrpc/transport/transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "elm_mcp/core/elm_mcp_server.hpp"
#include "elm_mcp/core/server_config.hpp"
#include "elm_mcp/packages/package_operations.hpp"
#include "elm_mcp/process/process_runner.hpp"
#include "elm_mcp/project/project_lock.hpp"
#include "elm_mcp/registry/http_registry_client.hpp"
#include "elm_mcp/registry/package_registry.hpp"
#include "elm_mcp/registry/registry_cache.hpp"
#include "elm_mcp/tools/tool_dispatcher.hpp"

using elm_mcp::ElmMcpServer;
using elm_mcp::ServerConfig;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::SocketTransport;
using jsonrpc::transport::StdioTransport;
using jsonrpc::transport::Transport;

namespace {

constexpr auto kLoopbackAddress = "127.0.0.1";

}  // namespace

auto main() -> int {
  // Initialize debugging features
  app::WaitForDebuggerIfRequested();
  app::InitializeCrashHandlers();
  app::IgnoreBrokenPipes();

  // Setup loggers
  auto loggers = app::SetupLoggers();
  auto logger = loggers["elm_mcp"];

  auto config = ServerConfig::Load(ServerConfig::ProcessEnvironment(), logger);
  if (!config) {
    logger->error("{}", config.error());
    return 1;
  }

  auto endpoint_url = elm_mcp::registry::RegistryEndpoint::Parse(
      config->registry.url);
  if (!endpoint_url) {
    logger->error("Unsupported registry URL: {}", config->registry.url);
    return 1;
  }

  // Create the IO context
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  // Wire the tool pipeline
  auto runner =
      std::make_shared<elm_mcp::process::ProcessRunner>(executor, logger);
  auto registry_client =
      std::make_shared<elm_mcp::registry::HttpRegistryClient>(
          executor, *endpoint_url, config->registry.timeout, logger);
  auto cache = std::make_shared<elm_mcp::registry::RegistryCache>(
      config->registry.cache_entries, config->registry.cache_ttl);
  auto registry = std::make_shared<elm_mcp::registry::PackageRegistry>(
      registry_client, cache, config->elm_home, logger);
  auto operations = std::make_shared<elm_mcp::packages::PackageOperations>(
      config->project_folder.Path(), runner, registry, config->manifest_tool,
      logger);
  auto lock = std::make_shared<elm_mcp::project::ProjectLock>(executor, logger);
  auto dispatcher = std::make_shared<elm_mcp::tools::ToolDispatcher>(
      executor, config->project_folder.Path(), runner, operations, lock,
      config->compiler, config->call_deadline, logger);

  // Create transport and endpoint
  std::unique_ptr<Transport> transport;
  if (config->port) {
    transport = std::make_unique<SocketTransport>(
        executor, kLoopbackAddress, *config->port, true, loggers["transport"]);
  } else {
    transport = std::make_unique<StdioTransport>(executor, loggers["transport"]);
  }

  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  auto server = std::make_unique<ElmMcpServer>(
      executor, std::move(endpoint), dispatcher, logger);

  // Stop cleanly on SIGINT / SIGTERM
  asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([&server, &io_context, logger](
                         const asio::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    logger->info("Received signal {}, shutting down", signal_number);
    asio::co_spawn(
        io_context,
        [&server, logger]() -> asio::awaitable<void> {
          auto result = co_await server->Shutdown();
          if (!result.has_value()) {
            logger->error("Shutdown error: {}", result.error().Message());
          }
        },
        asio::detached);
  });

  // Start the server asynchronously
  asio::co_spawn(
      io_context,
      [&server, &signals, logger]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          logger->error("Server error: {}", result.error().Message());
        }
        signals.cancel();
        co_return;
      },
      asio::detached);

  io_context.run();
  return 0;
}
