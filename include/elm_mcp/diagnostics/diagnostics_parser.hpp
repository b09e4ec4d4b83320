#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/diagnostics/diagnostic.hpp"
#include "elm_mcp/process/process_runner.hpp"

namespace elm_mcp::diagnostics {

// Output conventions a compiler can be configured to follow
enum class DiagnosticFormat {
  // One JSON document on stderr, as written by `elm make --report=json`
  kElmReport,
  // One flat JSON record per stdout line
  kJsonLines,
};

auto ParseDiagnosticFormat(std::string_view name)
    -> std::optional<DiagnosticFormat>;

// Stable order by (file, start line, start column); diagnostics without a
// region come first within their file
void SortDiagnostics(std::vector<Diagnostic>& diagnostics);

struct ParseReport {
  std::vector<Diagnostic> diagnostics;
  // Records that were recognizably structured but missed required fields
  int dropped_records = 0;
  // Output was not structured at all; diagnostics holds one synthetic entry
  bool used_fallback = false;
};

// Turns compiler output into an ordered diagnostic list. Never fails: broken
// records are dropped and counted, unstructured output becomes one synthetic
// error, and a failing exit code always yields at least one diagnostic.
class DiagnosticsParser {
 public:
  explicit DiagnosticsParser(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Parse(
      const process::ProcessOutput& output, DiagnosticFormat format) const
      -> ParseReport;

  // Flattens an Elm message (plain strings mixed with styled chunks)
  static auto FlattenMessage(const nlohmann::json& message)
      -> std::optional<std::string>;

 private:
  auto ParseElmReport(const process::ProcessOutput& output) const
      -> ParseReport;
  auto ParseJsonLines(const process::ProcessOutput& output) const
      -> ParseReport;

  // Parses one problem of a compile-errors report; nullopt drops it
  auto ParseElmProblem(const std::string& path, const nlohmann::json& problem)
      const -> std::optional<Diagnostic>;
  auto ParseJsonLinesRecord(const nlohmann::json& record) const
      -> std::optional<Diagnostic>;

  static auto FallbackReport(std::string raw_text) -> ParseReport;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace elm_mcp::diagnostics
