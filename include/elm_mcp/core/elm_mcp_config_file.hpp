#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "elm_mcp/diagnostics/diagnostics_parser.hpp"
#include "elm_mcp/utils/canonical_path.hpp"

namespace elm_mcp {

inline constexpr std::string_view kConfigFileName = ".elm-mcp.yaml";

// Represents the contents of a .elm-mcp.yaml file in the project folder.
// Every key is optional; a missing or invalid key keeps its default.
class ElmMcpConfigFile {
 public:
  struct Compiler {
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<diagnostics::DiagnosticFormat> format;
    std::optional<std::chrono::seconds> timeout;
  };

  struct ManifestTool {
    std::optional<std::string> command;
    std::optional<std::chrono::seconds> timeout;
  };

  struct Registry {
    std::optional<std::string> url;
    std::optional<std::chrono::seconds> timeout;
    std::optional<std::size_t> cache_entries;
    std::optional<std::chrono::seconds> cache_ttl;
  };

  struct Calls {
    std::optional<std::chrono::seconds> deadline;
  };

  explicit ElmMcpConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Returns std::nullopt if the file doesn't exist or is not valid YAML
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<ElmMcpConfigFile>;

  [[nodiscard]] auto GetCompiler() const -> const Compiler& {
    return compiler_;
  }

  [[nodiscard]] auto GetManifestTool() const -> const ManifestTool& {
    return manifest_tool_;
  }

  [[nodiscard]] auto GetRegistry() const -> const Registry& {
    return registry_;
  }

  [[nodiscard]] auto GetCalls() const -> const Calls& {
    return calls_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  Compiler compiler_;
  ManifestTool manifest_tool_;
  Registry registry_;
  Calls calls_;
};

}  // namespace elm_mcp
