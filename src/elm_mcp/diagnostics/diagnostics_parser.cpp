#include "elm_mcp/diagnostics/diagnostics_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <tuple>

namespace elm_mcp::diagnostics {

namespace {

constexpr std::string_view kFallbackTitle = "UNSTRUCTURED COMPILER OUTPUT";
constexpr std::string_view kGenericFailureTitle = "COMPILER FAILED";

auto Trim(std::string_view text) -> std::string_view {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

auto GetString(const nlohmann::json& j, const std::string& key)
    -> std::optional<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

auto GetInt(const nlohmann::json& j, const std::string& key)
    -> std::optional<int> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  // Out-of-range positions make the record malformed
  auto value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

// Elm: {"start":{"line","column"},"end":{"line","column"}}
auto ParseElmRegion(const nlohmann::json& region) -> std::optional<Region> {
  if (!region.is_object()) {
    return std::nullopt;
  }
  auto start = region.find("start");
  auto end = region.find("end");
  if (start == region.end() || end == region.end() || !start->is_object() ||
      !end->is_object()) {
    return std::nullopt;
  }
  auto start_line = GetInt(*start, "line");
  auto start_col = GetInt(*start, "column");
  auto end_line = GetInt(*end, "line");
  auto end_col = GetInt(*end, "column");
  if (!start_line || !start_col || !end_line || !end_col) {
    return std::nullopt;
  }
  return Region{
      .start_line = *start_line,
      .start_col = *start_col,
      .end_line = *end_line,
      .end_col = *end_col,
  };
}

// Flat: {"start_line","start_col","end_line","end_col"}
auto ParseFlatRegion(const nlohmann::json& region) -> std::optional<Region> {
  if (!region.is_object()) {
    return std::nullopt;
  }
  auto start_line = GetInt(region, "start_line");
  auto start_col = GetInt(region, "start_col");
  auto end_line = GetInt(region, "end_line");
  auto end_col = GetInt(region, "end_col");
  if (!start_line || !start_col || !end_line || !end_col) {
    return std::nullopt;
  }
  return Region{
      .start_line = *start_line,
      .start_col = *start_col,
      .end_line = *end_line,
      .end_col = *end_col,
  };
}

}  // namespace

auto ParseDiagnosticFormat(std::string_view name)
    -> std::optional<DiagnosticFormat> {
  auto lowered = ToLower(Trim(name));
  if (lowered == "elm-report") {
    return DiagnosticFormat::kElmReport;
  }
  if (lowered == "json-lines") {
    return DiagnosticFormat::kJsonLines;
  }
  return std::nullopt;
}

void SortDiagnostics(std::vector<Diagnostic>& diagnostics) {
  std::ranges::stable_sort(
      diagnostics, [](const Diagnostic& lhs, const Diagnostic& rhs) {
        const int lhs_line = lhs.region ? lhs.region->start_line : 0;
        const int lhs_col = lhs.region ? lhs.region->start_col : 0;
        const int rhs_line = rhs.region ? rhs.region->start_line : 0;
        const int rhs_col = rhs.region ? rhs.region->start_col : 0;
        return std::tie(lhs.file, lhs_line, lhs_col) <
               std::tie(rhs.file, rhs_line, rhs_col);
      });
}

DiagnosticsParser::DiagnosticsParser(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto DiagnosticsParser::Parse(
    const process::ProcessOutput& output, DiagnosticFormat format) const
    -> ParseReport {
  ParseReport report = format == DiagnosticFormat::kElmReport
                           ? ParseElmReport(output)
                           : ParseJsonLines(output);

  if (output.exit_code != 0 && report.diagnostics.empty()) {
    logger_->warn(
        "DiagnosticsParser: compiler exited with {} but reported nothing",
        output.exit_code);
    report.diagnostics.push_back(Diagnostic{
        .severity = DiagnosticSeverity::kError,
        .file = "",
        .region = std::nullopt,
        .title = std::string(kGenericFailureTitle),
        .message = fmt::format(
            "The compiler exited with code {} without reporting a "
            "diagnostic.",
            output.exit_code),
    });
  }

  SortDiagnostics(report.diagnostics);

  if (report.dropped_records > 0) {
    logger_->warn(
        "DiagnosticsParser dropped {} malformed record(s)",
        report.dropped_records);
  }
  return report;
}

auto DiagnosticsParser::FlattenMessage(const nlohmann::json& message)
    -> std::optional<std::string> {
  if (message.is_string()) {
    return message.get<std::string>();
  }
  if (!message.is_array()) {
    return std::nullopt;
  }
  std::string text;
  for (const auto& chunk : message) {
    if (chunk.is_string()) {
      text += chunk.get<std::string>();
    } else if (auto styled = GetString(chunk, "string")) {
      text += *styled;
    } else {
      return std::nullopt;
    }
  }
  return text;
}

auto DiagnosticsParser::FallbackReport(std::string raw_text) -> ParseReport {
  ParseReport report;
  report.used_fallback = true;
  report.diagnostics.push_back(Diagnostic{
      .severity = DiagnosticSeverity::kError,
      .file = "",
      .region = std::nullopt,
      .title = std::string(kFallbackTitle),
      .message = std::move(raw_text),
  });
  return report;
}

auto DiagnosticsParser::ParseElmReport(
    const process::ProcessOutput& output) const -> ParseReport {
  // Elm writes the report to stderr; some wrappers forward it to stdout
  std::string_view raw = Trim(output.stderr_data);
  if (raw.empty()) {
    raw = Trim(output.stdout_data);
    if (raw.empty() || raw.front() != '{') {
      return {};
    }
  }

  auto document = nlohmann::json::parse(raw, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    logger_->debug("DiagnosticsParser: compiler output is not a JSON report");
    return FallbackReport(std::string(raw));
  }

  auto type = GetString(document, "type");
  if (type == "error") {
    // Project-level failure such as a broken elm.json
    auto title = GetString(document, "title");
    auto message_it = document.find("message");
    std::optional<std::string> message;
    if (message_it != document.end()) {
      message = FlattenMessage(*message_it);
    }
    if (!title || !message) {
      logger_->debug("DiagnosticsParser: incomplete project-level error");
      return FallbackReport(std::string(raw));
    }
    ParseReport report;
    report.diagnostics.push_back(Diagnostic{
        .severity = DiagnosticSeverity::kError,
        .file = GetString(document, "path").value_or(""),
        .region = std::nullopt,
        .title = std::move(*title),
        .message = std::move(*message),
    });
    return report;
  }

  if (type != "compile-errors") {
    logger_->debug(
        "DiagnosticsParser: unknown report type '{}'", type.value_or(""));
    return FallbackReport(std::string(raw));
  }

  auto errors = document.find("errors");
  if (errors == document.end() || !errors->is_array()) {
    return FallbackReport(std::string(raw));
  }

  ParseReport report;
  for (const auto& module_error : *errors) {
    auto path = module_error.is_object() ? GetString(module_error, "path")
                                         : std::nullopt;
    auto problems = module_error.is_object() ? module_error.find("problems")
                                             : module_error.end();
    if (!path || problems == module_error.end() || !problems->is_array()) {
      logger_->debug("DiagnosticsParser: module error without path/problems");
      ++report.dropped_records;
      continue;
    }
    for (const auto& problem : *problems) {
      if (auto diagnostic = ParseElmProblem(*path, problem)) {
        report.diagnostics.push_back(std::move(*diagnostic));
      } else {
        ++report.dropped_records;
      }
    }
  }
  return report;
}

auto DiagnosticsParser::ParseElmProblem(
    const std::string& path, const nlohmann::json& problem) const
    -> std::optional<Diagnostic> {
  if (!problem.is_object()) {
    return std::nullopt;
  }
  auto title = GetString(problem, "title");
  auto message_it = problem.find("message");
  if (!title || message_it == problem.end()) {
    logger_->debug("DiagnosticsParser: problem in {} lacks title/message", path);
    return std::nullopt;
  }
  auto message = FlattenMessage(*message_it);
  if (!message) {
    logger_->debug("DiagnosticsParser: unreadable message in {}", path);
    return std::nullopt;
  }

  std::optional<Region> region;
  if (auto region_it = problem.find("region"); region_it != problem.end()) {
    region = ParseElmRegion(*region_it);
    if (!region) {
      logger_->debug("DiagnosticsParser: malformed region in {}", path);
      return std::nullopt;
    }
  }

  return Diagnostic{
      .severity = DiagnosticSeverity::kError,
      .file = path,
      .region = region,
      .title = std::move(*title),
      .message = std::move(*message),
  };
}

auto DiagnosticsParser::ParseJsonLines(
    const process::ProcessOutput& output) const -> ParseReport {
  ParseReport report;
  std::istringstream stream(output.stdout_data);
  std::string line;
  bool saw_json = false;
  bool saw_text = false;

  while (std::getline(stream, line)) {
    auto trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    saw_text = true;
    auto record = nlohmann::json::parse(trimmed, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
      // A truncated tail or interleaved progress text
      ++report.dropped_records;
      continue;
    }
    saw_json = true;
    if (auto diagnostic = ParseJsonLinesRecord(record)) {
      report.diagnostics.push_back(std::move(*diagnostic));
    } else {
      ++report.dropped_records;
    }
  }

  if (saw_text && !saw_json) {
    std::string raw(Trim(output.stdout_data));
    if (auto err = Trim(output.stderr_data); !err.empty()) {
      raw += "\n";
      raw += err;
    }
    return FallbackReport(std::move(raw));
  }
  if (!saw_text) {
    if (auto err = Trim(output.stderr_data);
        !err.empty() && output.exit_code != 0) {
      return FallbackReport(std::string(err));
    }
  }
  return report;
}

auto DiagnosticsParser::ParseJsonLinesRecord(const nlohmann::json& record) const
    -> std::optional<Diagnostic> {
  auto file = GetString(record, "file");
  auto title = GetString(record, "title");
  auto message_it = record.find("message");
  if (!file || !title || message_it == record.end()) {
    logger_->debug("DiagnosticsParser: record lacks file/title/message");
    return std::nullopt;
  }
  auto message = FlattenMessage(*message_it);
  if (!message) {
    return std::nullopt;
  }

  auto severity = DiagnosticSeverity::kError;
  if (auto severity_it = record.find("severity"); severity_it != record.end()) {
    if (!severity_it->is_string()) {
      return std::nullopt;
    }
    auto lowered = ToLower(severity_it->get<std::string>());
    if (lowered == "warning") {
      severity = DiagnosticSeverity::kWarning;
    } else if (lowered != "error") {
      logger_->debug("DiagnosticsParser: unknown severity '{}'", lowered);
      return std::nullopt;
    }
  }

  std::optional<Region> region;
  if (auto region_it = record.find("region");
      region_it != record.end() && !region_it->is_null()) {
    region = ParseFlatRegion(*region_it);
    if (!region) {
      return std::nullopt;
    }
  }

  return Diagnostic{
      .severity = severity,
      .file = std::move(*file),
      .region = region,
      .title = std::move(*title),
      .message = std::move(*message),
  };
}

}  // namespace elm_mcp::diagnostics
