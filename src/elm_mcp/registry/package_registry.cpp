#include "elm_mcp/registry/package_registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

#include "mcp/json_utils.hpp"

namespace elm_mcp::registry {

namespace {

// Symbol sections of a docs.json module and the kind reported for each
constexpr std::array<std::pair<std::string_view, std::string_view>, 4>
    kSymbolSections = {{
        {"values", "value"},
        {"unions", "union"},
        {"aliases", "alias"},
        {"binops", "binop"},
    }};

auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

auto ParseSearchEntry(const nlohmann::json& entry)
    -> std::optional<PackageSummary> {
  if (!entry.is_object() || !entry.contains("name") ||
      !entry.at("name").is_string()) {
    return std::nullopt;
  }
  auto ref = packages::PackageRef::Parse(entry.at("name").get<std::string>());
  if (!ref || ref->version) {
    return std::nullopt;
  }
  PackageSummary summary{
      .author = ref->author,
      .name = ref->name,
      .summary = mcp::string_or(entry, "summary"),
      .license = mcp::string_or(entry, "license"),
      .version = std::nullopt,
  };
  if (auto it = entry.find("version"); it != entry.end() && it->is_string()) {
    summary.version = packages::Version::Parse(it->get<std::string>());
  }
  return summary;
}

}  // namespace

void to_json(nlohmann::json& j, const PackageSummary& p) {
  mcp::to_json_required(j, "author", p.author);
  mcp::to_json_required(j, "name", p.name);
  mcp::to_json_required(j, "summary", p.summary);
  mcp::to_json_required(j, "license", p.license);
  mcp::to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, PackageSummary& p) {
  mcp::from_json_required(j, "author", p.author);
  mcp::from_json_required(j, "name", p.name);
  mcp::from_json_required(j, "summary", p.summary);
  mcp::from_json_required(j, "license", p.license);
  mcp::from_json_optional(j, "version", p.version);
}

PackageRegistry::PackageRegistry(
    std::shared_ptr<RegistryClient> client,
    std::shared_ptr<RegistryCache> cache, std::filesystem::path elm_home,
    std::shared_ptr<spdlog::logger> logger)
    : client_(std::move(client)),
      cache_(std::move(cache)),
      elm_home_(std::move(elm_home)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto PackageRegistry::Search(std::string query, std::optional<std::size_t> limit)
    -> asio::awaitable<std::expected<std::vector<PackageSummary>, ToolError>> {
  auto key = RegistryCache::SearchKey();
  auto document = cache_->Get(key);
  if (!document) {
    auto fetched = co_await client_->FetchAllPackages();
    if (!fetched) {
      co_return std::unexpected(fetched.error());
    }
    if (!fetched->is_array()) {
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kUnavailable,
          "The registry package list is not an array");
    }
    document = cache_->Put(key, std::move(*fetched));
  }

  const auto needle = ToLower(query);
  std::vector<PackageSummary> matches;
  int skipped = 0;
  for (const auto& entry : *document) {
    if (limit && matches.size() >= *limit) {
      break;
    }
    auto summary = ParseSearchEntry(entry);
    if (!summary) {
      ++skipped;
      continue;
    }
    if (!needle.empty() &&
        ToLower(summary->author + "/" + summary->name).find(needle) ==
            std::string::npos &&
        ToLower(summary->summary).find(needle) == std::string::npos) {
      continue;
    }
    matches.push_back(std::move(*summary));
  }

  if (skipped > 0) {
    logger_->debug("PackageRegistry skipped {} malformed search entries", skipped);
  }
  logger_->debug(
      "PackageRegistry search '{}' matched {} package(s)", query, matches.size());
  co_return matches;
}

auto PackageRegistry::Releases(std::string author, std::string name)
    -> asio::awaitable<std::expected<std::vector<packages::Version>, ToolError>> {
  auto key = RegistryCache::ReleasesKey(author, name);
  auto document = cache_->Get(key);
  if (!document) {
    auto fetched = co_await client_->FetchReleases(author, name);
    if (!fetched) {
      if (fetched.error().Kind() == ToolErrorKind::kNotFound) {
        co_return ToolError::UnexpectedFromKind(
            ToolErrorKind::kNotFound,
            fmt::format("Package {}/{} does not exist", author, name));
      }
      co_return std::unexpected(fetched.error());
    }
    if (!fetched->is_object()) {
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kUnavailable,
          fmt::format("Malformed release list for {}/{}", author, name));
    }
    document = cache_->Put(key, std::move(*fetched));
  }

  std::vector<packages::Version> versions;
  for (const auto& [text, published_at] : document->items()) {
    if (auto version = packages::Version::Parse(text)) {
      versions.push_back(*version);
    } else {
      logger_->debug(
          "PackageRegistry ignoring release '{}' of {}/{}", text, author, name);
    }
  }
  std::ranges::sort(versions);

  if (versions.empty()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound,
        fmt::format("Package {}/{} has no published releases", author, name));
  }
  co_return versions;
}

auto PackageRegistry::LatestVersion(std::string author, std::string name)
    -> asio::awaitable<std::expected<packages::Version, ToolError>> {
  auto versions = co_await Releases(author, name);
  if (!versions) {
    co_return std::unexpected(versions.error());
  }
  co_return versions->back();
}

auto PackageRegistry::LocalDocsPath(
    const std::string& author, const std::string& name,
    const packages::Version& version) const -> std::filesystem::path {
  return elm_home_ / kElmCompilerVersion / "packages" / author / name /
         version.ToString() / "docs.json";
}

auto PackageRegistry::ReadLocalDocs(
    const std::string& author, const std::string& name,
    const packages::Version& version) const -> std::optional<nlohmann::json> {
  if (elm_home_.empty()) {
    return std::nullopt;
  }
  auto path = LocalDocsPath(author, name, version);
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }
  auto document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded() || !document.is_array()) {
    logger_->warn("PackageRegistry ignoring unreadable {}", path.string());
    return std::nullopt;
  }
  logger_->debug("PackageRegistry using local docs {}", path.string());
  return document;
}

auto PackageRegistry::Docs(
    std::string author, std::string name, packages::Version version)
    -> asio::awaitable<std::expected<RegistryCache::Value, ToolError>> {
  auto key = RegistryCache::DocsKey(author, name, version.ToString());
  if (auto cached = cache_->Get(key)) {
    co_return cached;
  }

  if (auto local = ReadLocalDocs(author, name, version)) {
    co_return cache_->Put(key, std::move(*local));
  }

  auto fetched = co_await client_->FetchDocs(author, name, version);
  if (!fetched) {
    if (fetched.error().Kind() == ToolErrorKind::kNotFound) {
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kNotFound,
          fmt::format("No documentation for {}/{} {}", author, name, version));
    }
    co_return std::unexpected(fetched.error());
  }
  if (!fetched->is_array()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kUnavailable,
        fmt::format("Malformed documentation for {}/{} {}", author, name, version));
  }
  co_return cache_->Put(key, std::move(*fetched));
}

auto PackageRegistry::SelectDocs(
    const nlohmann::json& docs, const std::optional<std::string>& module,
    const std::optional<std::string>& symbol)
    -> std::expected<nlohmann::json, ToolError> {
  if (!module) {
    if (symbol) {
      return ToolError::UnexpectedFromKind(
          ToolErrorKind::kInvalidArguments, "'symbol' requires 'module'");
    }
    return docs;
  }

  auto module_it =
      std::find_if(docs.begin(), docs.end(), [&](const nlohmann::json& m) {
        return mcp::string_or(m, "name") == *module;
      });
  if (module_it == docs.end()) {
    return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound, fmt::format("No module named {}", *module));
  }
  if (!symbol) {
    return *module_it;
  }

  for (const auto& [section, kind] : kSymbolSections) {
    auto entries = module_it->find(std::string(section));
    if (entries == module_it->end() || !entries->is_array()) {
      continue;
    }
    for (const auto& entry : *entries) {
      if (mcp::string_or(entry, "name") == *symbol) {
        nlohmann::json selected = entry;
        selected["kind"] = std::string(kind);
        return selected;
      }
    }
  }
  return ToolError::UnexpectedFromKind(
      ToolErrorKind::kNotFound,
      fmt::format("Module {} has no symbol named {}", *module, *symbol));
}

}  // namespace elm_mcp::registry
