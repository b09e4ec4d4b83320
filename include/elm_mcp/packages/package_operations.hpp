#pragma once

#include <chrono>
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
#include "elm_mcp/process/process_runner.hpp"
#include "elm_mcp/registry/package_registry.hpp"

namespace elm_mcp::packages {

struct ManifestToolOptions {
  std::string command = "elm-json";
  std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

struct AddPackageResult {
  // Carries the version recorded in elm.json
  PackageRef package;
  bool already_present = false;
};

struct DocsResult {
  PackageRef package;
  std::optional<std::string> module;
  std::optional<std::string> symbol;
  nlohmann::json docs;
};

void to_json(nlohmann::json& j, const AddPackageResult& r);
void to_json(nlohmann::json& j, const DocsResult& r);

// Dependency and registry operations against the one project folder.
//
// Manifest changes go through the external manifest tool; this class only
// reads elm.json. Callers hold the project lock: exclusive around
// AddPackage and RemovePackage, shared around RecordedVersion.
class PackageOperations {
 public:
  PackageOperations(
      std::filesystem::path project_root,
      std::shared_ptr<process::ProcessRunner> runner,
      std::shared_ptr<registry::PackageRegistry> registry,
      ManifestToolOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Already a direct dependency at the requested (or any, when none is
  // requested) version: success without running the tool. Present at a
  // different version: kConflictingConstraints. With `test`, a direct entry
  // in either section counts.
  auto AddPackage(PackageRef ref, bool test)
      -> asio::awaitable<std::expected<AddPackageResult, ToolError>>;

  // kNotFound unless ref is a direct dependency in the chosen section
  auto RemovePackage(PackageRef ref, bool test)
      -> asio::awaitable<std::expected<PackageRef, ToolError>>;

  auto SearchPackages(std::string query, std::optional<std::size_t> limit)
      -> asio::awaitable<
          std::expected<std::vector<registry::PackageSummary>, ToolError>>;

  auto GetLatestVersion(std::string author, std::string name)
      -> asio::awaitable<std::expected<PackageRef, ToolError>>;

  // Version of a dependency as elm.json records it, preferring direct over
  // indirect and normal over test entries. nullopt without a readable
  // manifest.
  auto RecordedVersion(const PackageRef& ref) const -> std::optional<Version>;

  // Version: explicit, else latest published. Callers wanting the project's
  // version resolve it with RecordedVersion first.
  auto GetDocs(
      PackageRef ref, std::optional<std::string> module,
      std::optional<std::string> symbol)
      -> asio::awaitable<std::expected<DocsResult, ToolError>>;

 private:
  auto RunManifestTool(std::vector<std::string> args)
      -> asio::awaitable<std::expected<process::ProcessOutput, ToolError>>;

  // Explains a failed install using the registry's release list
  auto ClassifyInstallFailure(const PackageRef& ref, std::string tool_message)
      -> asio::awaitable<ToolError>;

  std::filesystem::path project_root_;
  std::shared_ptr<process::ProcessRunner> runner_;
  std::shared_ptr<registry::PackageRegistry> registry_;
  ManifestToolOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
};

// Tool output with ANSI colour sequences removed and whitespace trimmed;
// stderr when it has content, stdout otherwise
auto ToolMessage(const process::ProcessOutput& output) -> std::string;

}  // namespace elm_mcp::packages
