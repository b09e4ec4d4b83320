#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/error/tool_error.hpp"
#include "elm_mcp/packages/package_ref.hpp"
#include "elm_mcp/registry/registry_cache.hpp"
#include "elm_mcp/registry/registry_client.hpp"

namespace elm_mcp::registry {

// Elm compiler release whose package cache layout is read
inline constexpr std::string_view kElmCompilerVersion = "0.19.1";

struct PackageSummary {
  std::string author;
  std::string name;
  std::string summary;
  std::string license;
  std::optional<packages::Version> version;
};

void to_json(nlohmann::json& j, const PackageSummary& p);
void from_json(const nlohmann::json& j, PackageSummary& p);

// Registry lookups shaped for the tools, read through the cache
class PackageRegistry {
 public:
  PackageRegistry(
      std::shared_ptr<RegistryClient> client,
      std::shared_ptr<RegistryCache> cache, std::filesystem::path elm_home,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Case-insensitive substring match on "author/name" and the summary, in
  // registry order. An empty query matches everything.
  auto Search(std::string query, std::optional<std::size_t> limit)
      -> asio::awaitable<std::expected<std::vector<PackageSummary>, ToolError>>;

  // Published versions, ascending
  auto Releases(std::string author, std::string name)
      -> asio::awaitable<
          std::expected<std::vector<packages::Version>, ToolError>>;

  auto LatestVersion(std::string author, std::string name)
      -> asio::awaitable<std::expected<packages::Version, ToolError>>;

  // Full docs.json of one release. The local package cache of the Elm
  // compiler is consulted before the registry.
  auto Docs(std::string author, std::string name, packages::Version version)
      -> asio::awaitable<std::expected<RegistryCache::Value, ToolError>>;

  // Narrows a docs.json document to one module and optionally one of its
  // values, unions, aliases or binops
  static auto SelectDocs(
      const nlohmann::json& docs, const std::optional<std::string>& module,
      const std::optional<std::string>& symbol)
      -> std::expected<nlohmann::json, ToolError>;

  [[nodiscard]] auto LocalDocsPath(
      const std::string& author, const std::string& name,
      const packages::Version& version) const -> std::filesystem::path;

 private:
  auto ReadLocalDocs(
      const std::string& author, const std::string& name,
      const packages::Version& version) const -> std::optional<nlohmann::json>;

  std::shared_ptr<RegistryClient> client_;
  std::shared_ptr<RegistryCache> cache_;
  std::filesystem::path elm_home_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace elm_mcp::registry
