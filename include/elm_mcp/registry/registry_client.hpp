#pragma once

#include <expected>
#include <string>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "elm_mcp/error/tool_error.hpp"
#include "elm_mcp/packages/package_ref.hpp"

namespace elm_mcp::registry {

// Raw access to the package registry. Each call returns the decoded JSON
// document of one endpoint; shaping and caching live in PackageRegistry.
//
// Errors: kNotFound (HTTP 404), kTimedOut, kUnavailable (transport failure,
// unexpected status, undecodable body), kCancelled.
class RegistryClient {
 public:
  RegistryClient() = default;
  RegistryClient(const RegistryClient&) = delete;
  RegistryClient(RegistryClient&&) = delete;
  auto operator=(const RegistryClient&) -> RegistryClient& = delete;
  auto operator=(RegistryClient&&) -> RegistryClient& = delete;
  virtual ~RegistryClient() = default;

  // GET /search.json: [{name, summary, license, version}]
  virtual auto FetchAllPackages()
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> = 0;

  // GET /packages/{author}/{name}/releases.json: {"1.0.0": <posix time>}
  virtual auto FetchReleases(std::string author, std::string name)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> = 0;

  // GET /packages/{author}/{name}/{version}/docs.json: [module]
  virtual auto FetchDocs(
      std::string author, std::string name, packages::Version version)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> = 0;
};

}  // namespace elm_mcp::registry
