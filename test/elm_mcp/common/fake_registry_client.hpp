#pragma once

#include <map>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "elm_mcp/registry/registry_client.hpp"

namespace elm_mcp::test {

// In-memory registry. Unknown documents answer NotFound, like HTTP 404.
class FakeRegistryClient : public registry::RegistryClient {
 public:
  nlohmann::json packages = nlohmann::json::array();
  // "author/name" -> {"1.0.0": 1530000000, ...}
  std::map<std::string, nlohmann::json> releases;
  // "author/name@version" -> [module, ...]
  std::map<std::string, nlohmann::json> docs;
  // When set, every fetch fails with it
  std::optional<ToolError> failure;

  int search_fetches = 0;
  int release_fetches = 0;
  int docs_fetches = 0;

  auto AddPackage(
      const std::string& full_name, const std::string& summary,
      std::initializer_list<std::string_view> versions) -> void {
    nlohmann::json published = nlohmann::json::object();
    int timestamp = 1500000000;
    for (auto version : versions) {
      published[std::string(version)] = timestamp++;
    }
    packages.push_back({
        {"name", full_name},
        {"summary", summary},
        {"license", "BSD-3-Clause"},
        {"version", std::string(*(versions.end() - 1))},
    });
    releases[full_name] = std::move(published);
  }

  auto FetchAllPackages()
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override {
    ++search_fetches;
    if (failure) {
      co_return std::unexpected(*failure);
    }
    co_return packages;
  }

  auto FetchReleases(std::string author, std::string name)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override {
    ++release_fetches;
    if (failure) {
      co_return std::unexpected(*failure);
    }
    auto it = releases.find(author + "/" + name);
    if (it == releases.end()) {
      co_return ToolError::UnexpectedFromKind(ToolErrorKind::kNotFound, "404");
    }
    co_return it->second;
  }

  auto FetchDocs(
      std::string author, std::string name, packages::Version version)
      -> asio::awaitable<std::expected<nlohmann::json, ToolError>> override {
    ++docs_fetches;
    if (failure) {
      co_return std::unexpected(*failure);
    }
    auto it = docs.find(fmt::format("{}/{}@{}", author, name, version));
    if (it == docs.end()) {
      co_return ToolError::UnexpectedFromKind(ToolErrorKind::kNotFound, "404");
    }
    co_return it->second;
  }
};

}  // namespace elm_mcp::test
