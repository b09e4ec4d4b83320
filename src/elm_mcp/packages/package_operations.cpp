#include "elm_mcp/packages/package_operations.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/ranges.h>

#include "elm_mcp/packages/elm_manifest.hpp"
#include "mcp/json_utils.hpp"

namespace elm_mcp::packages {

namespace {

auto StripAnsi(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      // CSI: parameters and intermediates up to a final byte in @..~
      i += 2;
      while (i < text.size() && (text[i] < '@' || text[i] > '~')) {
        ++i;
      }
      continue;
    }
    result.push_back(text[i]);
  }
  return result;
}

auto TrimCopy(std::string_view text) -> std::string {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return std::string(text);
}

auto ValidateIdentity(const PackageRef& ref) -> std::expected<void, ToolError> {
  if (!IsValidAuthor(ref.author) || !IsValidPackageName(ref.name)) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInvalidArguments,
        fmt::format("'{}/{}' is not a valid package name", ref.author, ref.name));
  }
  return Ok();
}

auto SectionName(bool test) -> std::string_view {
  return test ? "test-dependencies" : "dependencies";
}

}  // namespace

void to_json(nlohmann::json& j, const AddPackageResult& r) {
  mcp::to_json_required(j, "package", r.package);
  mcp::to_json_required(j, "already_present", r.already_present);
}

void to_json(nlohmann::json& j, const DocsResult& r) {
  mcp::to_json_required(j, "package", r.package);
  mcp::to_json_optional(j, "module", r.module);
  mcp::to_json_optional(j, "symbol", r.symbol);
  mcp::to_json_required(j, "docs", r.docs);
}

auto ToolMessage(const process::ProcessOutput& output) -> std::string {
  auto message = TrimCopy(StripAnsi(output.stderr_data));
  if (message.empty()) {
    message = TrimCopy(StripAnsi(output.stdout_data));
  }
  if (message.empty()) {
    message = fmt::format("exited with code {}", output.exit_code);
  }
  return message;
}

PackageOperations::PackageOperations(
    std::filesystem::path project_root,
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<registry::PackageRegistry> registry,
    ManifestToolOptions options, std::shared_ptr<spdlog::logger> logger)
    : project_root_(std::move(project_root)),
      runner_(std::move(runner)),
      registry_(std::move(registry)),
      options_(std::move(options)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto PackageOperations::RunManifestTool(std::vector<std::string> args)
    -> asio::awaitable<std::expected<process::ProcessOutput, ToolError>> {
  logger_->debug(
      "PackageOperations running {} {}", options_.command,
      fmt::join(args, " "));
  co_return co_await runner_->Run(process::ProcessRequest{
      .program = options_.command,
      .args = std::move(args),
      .working_dir = project_root_,
      .timeout = options_.timeout,
      .stdin_data = std::nullopt,
  });
}

auto PackageOperations::AddPackage(PackageRef ref, bool test)
    -> asio::awaitable<std::expected<AddPackageResult, ToolError>> {
  if (auto valid = ValidateIdentity(ref); !valid) {
    co_return std::unexpected(valid.error());
  }

  auto manifest = ElmManifest::Load(project_root_);
  if (!manifest) {
    co_return std::unexpected(manifest.error());
  }

  auto recorded_in_test = test;
  auto recorded = manifest->FindDirect(ref.author, ref.name, test);
  if (!recorded && test) {
    // Normal direct dependencies are already visible to the tests
    recorded = manifest->FindDirect(ref.author, ref.name, false);
    recorded_in_test = false;
  }
  if (recorded) {
    if (!ref.version || *ref.version == *recorded) {
      logger_->debug(
          "PackageOperations: {} already in {} at {}", ref.FullName(),
          SectionName(recorded_in_test), *recorded);
      co_return AddPackageResult{
          .package = ref.WithVersion(*recorded),
          .already_present = true,
      };
    }
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kConflictingConstraints,
        fmt::format(
            "{} is already a direct {} entry at {}, not {}", ref.FullName(),
            SectionName(recorded_in_test), *recorded, *ref.version));
  }

  std::vector<std::string> args{"install", "--yes"};
  if (test) {
    args.emplace_back("--test");
  }
  args.push_back(
      ref.version ? fmt::format("{}@{}", ref.FullName(), *ref.version)
                  : ref.FullName());

  auto output = co_await RunManifestTool(std::move(args));
  if (!output) {
    co_return std::unexpected(output.error());
  }
  if (output->exit_code != 0) {
    co_return std::unexpected(
        co_await ClassifyInstallFailure(ref, ToolMessage(*output)));
  }

  auto updated = ElmManifest::Load(project_root_);
  if (!updated) {
    co_return std::unexpected(updated.error());
  }
  auto installed = updated->FindDirect(ref.author, ref.name, test);
  if (!installed) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal,
        fmt::format(
            "{} succeeded but {} is not in {}", options_.command,
            ref.FullName(), SectionName(test)));
  }

  logger_->info(
      "PackageOperations added {}@{} to {}", ref.FullName(), *installed,
      SectionName(test));
  co_return AddPackageResult{
      .package = ref.WithVersion(*installed),
      .already_present = false,
  };
}

auto PackageOperations::ClassifyInstallFailure(
    const PackageRef& ref, std::string tool_message)
    -> asio::awaitable<ToolError> {
  auto releases = co_await registry_->Releases(ref.author, ref.name);
  if (!releases) {
    switch (releases.error().Kind()) {
      case ToolErrorKind::kNotFound:
      case ToolErrorKind::kCancelled:
      case ToolErrorKind::kTimedOut:
        co_return releases.error();
      default:
        logger_->debug(
            "PackageOperations could not consult the registry: {}",
            releases.error().Message());
        co_return ToolError::FromKind(
            ToolErrorKind::kConflictingConstraints, tool_message);
    }
  }

  if (ref.version && std::ranges::find(*releases, *ref.version) == releases->end()) {
    co_return ToolError::FromKind(
        ToolErrorKind::kNotFound,
        fmt::format("{} has no published version {}", ref.FullName(), *ref.version));
  }
  co_return ToolError::FromKind(
      ToolErrorKind::kConflictingConstraints, tool_message);
}

auto PackageOperations::RemovePackage(PackageRef ref, bool test)
    -> asio::awaitable<std::expected<PackageRef, ToolError>> {
  if (auto valid = ValidateIdentity(ref); !valid) {
    co_return std::unexpected(valid.error());
  }

  auto manifest = ElmManifest::Load(project_root_);
  if (!manifest) {
    co_return std::unexpected(manifest.error());
  }
  auto recorded = manifest->FindDirect(ref.author, ref.name, test);
  if (!recorded) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound,
        fmt::format(
            "{} is not a direct entry in {}", ref.FullName(), SectionName(test)));
  }

  // The manifest tool removes the package from whichever section holds it
  auto output = co_await RunManifestTool({"uninstall", "--yes", ref.FullName()});
  if (!output) {
    co_return std::unexpected(output.error());
  }
  if (output->exit_code != 0) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kConflictingConstraints, ToolMessage(*output));
  }

  auto updated = ElmManifest::Load(project_root_);
  if (!updated) {
    co_return std::unexpected(updated.error());
  }
  if (updated->FindDirect(ref.author, ref.name, test)) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInternal,
        fmt::format(
            "{} succeeded but {} is still in {}", options_.command,
            ref.FullName(), SectionName(test)));
  }

  logger_->info(
      "PackageOperations removed {}@{} from {}", ref.FullName(), *recorded,
      SectionName(test));
  co_return ref.WithVersion(*recorded);
}

auto PackageOperations::SearchPackages(
    std::string query, std::optional<std::size_t> limit)
    -> asio::awaitable<
        std::expected<std::vector<registry::PackageSummary>, ToolError>> {
  co_return co_await registry_->Search(std::move(query), limit);
}

auto PackageOperations::GetLatestVersion(std::string author, std::string name)
    -> asio::awaitable<std::expected<PackageRef, ToolError>> {
  PackageRef ref{.author = std::move(author), .name = std::move(name)};
  if (auto valid = ValidateIdentity(ref); !valid) {
    co_return std::unexpected(valid.error());
  }
  auto latest = co_await registry_->LatestVersion(ref.author, ref.name);
  if (!latest) {
    co_return std::unexpected(latest.error());
  }
  co_return ref.WithVersion(*latest);
}

auto PackageOperations::RecordedVersion(const PackageRef& ref) const
    -> std::optional<Version> {
  auto manifest = ElmManifest::Load(project_root_);
  if (!manifest) {
    logger_->debug(
        "PackageOperations: no manifest version for {} ({})", ref.FullName(),
        manifest.error().Message());
    return std::nullopt;
  }
  return manifest->FindAny(ref.author, ref.name);
}

auto PackageOperations::GetDocs(
    PackageRef ref, std::optional<std::string> module,
    std::optional<std::string> symbol)
    -> asio::awaitable<std::expected<DocsResult, ToolError>> {
  if (auto valid = ValidateIdentity(ref); !valid) {
    co_return std::unexpected(valid.error());
  }
  if (symbol && !module) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInvalidArguments, "'symbol' requires 'module'");
  }

  if (!ref.version) {
    auto latest = co_await registry_->LatestVersion(ref.author, ref.name);
    if (!latest) {
      co_return std::unexpected(latest.error());
    }
    ref.version = *latest;
  }

  auto docs = co_await registry_->Docs(ref.author, ref.name, *ref.version);
  if (!docs) {
    co_return std::unexpected(docs.error());
  }
  auto selected = registry::PackageRegistry::SelectDocs(**docs, module, symbol);
  if (!selected) {
    co_return std::unexpected(selected.error());
  }

  co_return DocsResult{
      .package = std::move(ref),
      .module = std::move(module),
      .symbol = std::move(symbol),
      .docs = std::move(*selected),
  };
}

}  // namespace elm_mcp::packages
