#pragma once

#include <optional>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace elm_mcp::diagnostics {

enum class DiagnosticSeverity {
  kError,
  kWarning,
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& s);
void from_json(const nlohmann::json& j, DiagnosticSeverity& s);

// 1-based, as the compiler reports it
struct Region {
  int start_line = 0;
  int start_col = 0;
  int end_line = 0;
  int end_col = 0;

  friend auto operator==(const Region&, const Region&) -> bool = default;
};

void to_json(nlohmann::json& j, const Region& r);
void from_json(const nlohmann::json& j, Region& r);

struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::kError;
  std::string file;
  std::optional<Region> region;
  std::string title;
  std::string message;

  friend auto operator==(const Diagnostic&, const Diagnostic&) -> bool =
      default;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

}  // namespace elm_mcp::diagnostics

template <>
struct fmt::formatter<elm_mcp::diagnostics::DiagnosticSeverity>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(
      const elm_mcp::diagnostics::DiagnosticSeverity& s,
      FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        s == elm_mcp::diagnostics::DiagnosticSeverity::kError ? "error"
                                                              : "warning",
        ctx);
  }
};
