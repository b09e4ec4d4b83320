#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/registry/registry_client.hpp"

namespace elm_mcp::registry {

struct RegistryEndpoint {
  bool tls = true;
  std::string host;
  std::string port;
  // Prefix for every request target, without trailing slash
  std::string base_path;

  // Accepts http:// and https:// URLs with optional port and path
  static auto Parse(std::string_view url) -> std::optional<RegistryEndpoint>;
};

struct HttpResponse {
  unsigned status = 0;
  std::string body;
};

// Talks HTTP(S) to the registry with Boost.Beast. Requests run on a private
// Boost.Asio io_context thread and complete back onto the server executor.
// Cancelling the awaiting coroutine abandons the wait at once; the request
// itself stops at its own timeout.
class HttpRegistryClient : public RegistryClient {
 public:
  HttpRegistryClient(
      asio::any_io_executor executor, RegistryEndpoint endpoint,
      std::chrono::milliseconds timeout,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~HttpRegistryClient() override;

  auto FetchAllPackages()
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override;

  auto FetchReleases(std::string author, std::string name)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override;

  auto FetchDocs(std::string author, std::string name, packages::Version version)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override;

  // Performs one GET and returns the status and body as received
  auto Get(std::string target)
      -> asio::awaitable<std::expected<HttpResponse, ToolError>>;

 private:
  auto GetJson(std::string target)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>>;

  asio::any_io_executor executor_;
  RegistryEndpoint endpoint_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<spdlog::logger> logger_;

  boost::asio::io_context io_context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  boost::asio::ssl::context ssl_context_;
  std::thread io_thread_;
};

}  // namespace elm_mcp::registry
