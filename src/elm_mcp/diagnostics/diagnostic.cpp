#include "elm_mcp/diagnostics/diagnostic.hpp"

#include <stdexcept>

#include "mcp/json_utils.hpp"

namespace elm_mcp::diagnostics {

using mcp::from_json_optional;
using mcp::from_json_required;
using mcp::to_json_optional;
using mcp::to_json_required;

void to_json(nlohmann::json& j, const DiagnosticSeverity& s) {
  switch (s) {
    case DiagnosticSeverity::kError:
      j = "error";
      break;
    case DiagnosticSeverity::kWarning:
      j = "warning";
      break;
  }
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& s) {
  if (j == "error") {
    s = DiagnosticSeverity::kError;
  } else if (j == "warning") {
    s = DiagnosticSeverity::kWarning;
  } else {
    throw std::runtime_error("Invalid diagnostic severity");
  }
}

void to_json(nlohmann::json& j, const Region& r) {
  to_json_required(j, "start_line", r.start_line);
  to_json_required(j, "start_col", r.start_col);
  to_json_required(j, "end_line", r.end_line);
  to_json_required(j, "end_col", r.end_col);
}

void from_json(const nlohmann::json& j, Region& r) {
  from_json_required(j, "start_line", r.start_line);
  from_json_required(j, "start_col", r.start_col);
  from_json_required(j, "end_line", r.end_line);
  from_json_required(j, "end_col", r.end_col);
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  to_json_required(j, "severity", d.severity);
  to_json_required(j, "file", d.file);
  to_json_optional(j, "region", d.region);
  to_json_required(j, "title", d.title);
  to_json_required(j, "message", d.message);
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  from_json_required(j, "severity", d.severity);
  from_json_required(j, "file", d.file);
  from_json_optional(j, "region", d.region);
  from_json_required(j, "title", d.title);
  from_json_required(j, "message", d.message);
}

}  // namespace elm_mcp::diagnostics
