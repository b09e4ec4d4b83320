#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace elm_mcp {

enum class ToolErrorKind {
  kInvalidArguments,
  kNotFound,
  kAlreadyPresent,
  kConflictingConstraints,
  kSpawnFailed,
  kTimedOut,
  kCancelled,
  kParseAnomaly,
  kUnavailable,
  kInternal,
};

namespace detail {

inline auto KindName(ToolErrorKind kind) -> std::string_view {
  switch (kind) {
    case ToolErrorKind::kInvalidArguments:
      return "invalid_arguments";
    case ToolErrorKind::kNotFound:
      return "not_found";
    case ToolErrorKind::kAlreadyPresent:
      return "already_present";
    case ToolErrorKind::kConflictingConstraints:
      return "conflicting_constraints";
    case ToolErrorKind::kSpawnFailed:
      return "spawn_failed";
    case ToolErrorKind::kTimedOut:
      return "timed_out";
    case ToolErrorKind::kCancelled:
      return "cancelled";
    case ToolErrorKind::kParseAnomaly:
      return "parse_anomaly";
    case ToolErrorKind::kUnavailable:
      return "unavailable";
    case ToolErrorKind::kInternal:
      return "internal";
  }
  return "internal";
}

inline auto DefaultMessageFor(ToolErrorKind kind) -> std::string {
  switch (kind) {
    case ToolErrorKind::kInvalidArguments:
      return "Invalid arguments";
    case ToolErrorKind::kNotFound:
      return "Not found";
    case ToolErrorKind::kAlreadyPresent:
      return "Already present";
    case ToolErrorKind::kConflictingConstraints:
      return "Conflicting constraints";
    case ToolErrorKind::kSpawnFailed:
      return "Failed to spawn process";
    case ToolErrorKind::kTimedOut:
      return "Timed out";
    case ToolErrorKind::kCancelled:
      return "Cancelled";
    case ToolErrorKind::kParseAnomaly:
      return "Malformed external output";
    case ToolErrorKind::kUnavailable:
      return "Service unavailable";
    case ToolErrorKind::kInternal:
      return "Internal error";
  }
  return "Internal error";
}

}  // namespace detail

// Error value carried by every tool-level std::expected in the server.
// The originating tool name is attached by the dispatcher, nothing else
// rewrites an error on its way to the protocol boundary.
class ToolError {
 public:
  explicit ToolError(ToolErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {
  }

  [[nodiscard]] auto Kind() const -> ToolErrorKind {
    return kind_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto Tool() const -> const std::optional<std::string>& {
    return tool_;
  }

  // Timeouts and transport failures may succeed when the caller retries
  [[nodiscard]] auto Retryable() const -> bool {
    return kind_ == ToolErrorKind::kTimedOut ||
           kind_ == ToolErrorKind::kUnavailable;
  }

  [[nodiscard]] auto WithTool(std::string tool) const -> ToolError {
    ToolError copy = *this;
    copy.tool_ = std::move(tool);
    return copy;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    nlohmann::json j{
        {"kind", detail::KindName(kind_)},
        {"message", message_},
        {"retryable", Retryable()},
    };
    if (tool_) {
      j["tool"] = *tool_;
    }
    return j;
  }

  static auto FromKind(ToolErrorKind kind, const std::string& message = "")
      -> ToolError {
    if (message.empty()) {
      return ToolError(kind, detail::DefaultMessageFor(kind));
    }
    return ToolError(kind, message);
  }

  static auto UnexpectedFromKind(
      ToolErrorKind kind, const std::string& details = "")
      -> std::unexpected<ToolError> {
    return std::unexpected<ToolError>(FromKind(kind, details));
  }

 private:
  ToolErrorKind kind_;
  std::string message_;
  std::optional<std::string> tool_;
};

inline auto Ok() -> std::expected<void, ToolError> {
  return {};
}

inline void to_json(nlohmann::json& j, const ToolError& e) {
  j = e.ToJson();
}

}  // namespace elm_mcp

template <>
struct fmt::formatter<elm_mcp::ToolErrorKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const elm_mcp::ToolErrorKind& kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        elm_mcp::detail::KindName(kind), ctx);
  }
};
