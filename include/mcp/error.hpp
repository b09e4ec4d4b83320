#pragma once

#include <expected>
#include <string>
#include <utility>

#include <jsonrpc/error/error.hpp>
#include <nlohmann/json.hpp>

namespace mcp::error {

using RpcError = jsonrpc::error::RpcError;
using RpcErrorCode = jsonrpc::error::RpcErrorCode;

// Protocol-level failures. Tool failures are not protocol errors: they travel
// inside a successful tools/call result.
enum class McpErrorCode {
  // RPC errors passthrough
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,
  kServerError,
  kTransportError,
  kTimeoutError,
  kClientError,

  // MCP errors
  kMethodNotImplemented,
  kNotInitialized,

  // Unknown error
  kUnknownError,
};

namespace detail {

inline auto DefaultMessageFor(McpErrorCode code) -> std::string {
  switch (code) {
    case McpErrorCode::kParseError:
      return "Parse error";
    case McpErrorCode::kInvalidRequest:
      return "Invalid request";
    case McpErrorCode::kMethodNotFound:
      return "Method not found";
    case McpErrorCode::kInvalidParams:
      return "Invalid params";
    case McpErrorCode::kInternalError:
      return "Internal error";
    case McpErrorCode::kServerError:
      return "Server error";
    case McpErrorCode::kTransportError:
      return "Transport error";
    case McpErrorCode::kTimeoutError:
      return "Timeout error";
    case McpErrorCode::kClientError:
      return "Client error";
    case McpErrorCode::kMethodNotImplemented:
      return "Method not implemented";
    case McpErrorCode::kNotInitialized:
      return "Server not initialized";
    case McpErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

// JSON-RPC numeric code reported to the client
inline auto WireCodeFor(McpErrorCode code) -> int {
  switch (code) {
    case McpErrorCode::kParseError:
      return -32700;
    case McpErrorCode::kInvalidRequest:
      return -32600;
    case McpErrorCode::kMethodNotFound:
    case McpErrorCode::kMethodNotImplemented:
      return -32601;
    case McpErrorCode::kInvalidParams:
      return -32602;
    case McpErrorCode::kNotInitialized:
      return -32002;
    case McpErrorCode::kInternalError:
    case McpErrorCode::kServerError:
    case McpErrorCode::kTransportError:
    case McpErrorCode::kTimeoutError:
    case McpErrorCode::kClientError:
    case McpErrorCode::kUnknownError:
      return -32603;
  }
  return -32603;
}

}  // namespace detail

class McpError {
 public:
  explicit McpError(McpErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> McpErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    return {
        {"code", detail::WireCodeFor(code_)},
        {"message", message_},
    };
  }

  static auto FromCode(McpErrorCode code, const std::string& message = "")
      -> McpError {
    if (message.empty()) {
      return McpError(code, detail::DefaultMessageFor(code));
    }
    return McpError(code, message);
  }

  static auto UnexpectedFromCode(
      McpErrorCode code, const std::string& details = "")
      -> std::unexpected<McpError> {
    return std::unexpected<McpError>(FromCode(code, details));
  }

  static auto FromRpcError(const RpcError& error) -> McpError {
    McpErrorCode code{};
    switch (error.Code()) {
      case RpcErrorCode::kParseError:
        code = McpErrorCode::kParseError;
        break;
      case RpcErrorCode::kInvalidRequest:
        code = McpErrorCode::kInvalidRequest;
        break;
      case RpcErrorCode::kMethodNotFound:
        code = McpErrorCode::kMethodNotFound;
        break;
      case RpcErrorCode::kInvalidParams:
        code = McpErrorCode::kInvalidParams;
        break;
      case RpcErrorCode::kInternalError:
        code = McpErrorCode::kInternalError;
        break;
      case RpcErrorCode::kServerError:
        code = McpErrorCode::kServerError;
        break;
      case RpcErrorCode::kTransportError:
        code = McpErrorCode::kTransportError;
        break;
      case RpcErrorCode::kTimeoutError:
        code = McpErrorCode::kTimeoutError;
        break;
      case RpcErrorCode::kClientError:
        code = McpErrorCode::kClientError;
        break;
      default:
        code = McpErrorCode::kUnknownError;
        break;
    }
    return McpError(code, error.Message());
  }

  static auto UnexpectedFromRpcError(const RpcError& error)
      -> std::unexpected<McpError> {
    return std::unexpected<McpError>(FromRpcError(error));
  }

 private:
  McpErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, McpError> {
  return {};
}

inline void to_json(nlohmann::json& j, const McpError& e) {
  j = e.ToJson();
}

}  // namespace mcp::error
