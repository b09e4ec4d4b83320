#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/diagnostics/diagnostics_parser.hpp"
#include "elm_mcp/packages/package_operations.hpp"
#include "elm_mcp/process/process_runner.hpp"
#include "elm_mcp/project/project_lock.hpp"
#include "elm_mcp/tools/tool_request.hpp"
#include "elm_mcp/tools/tool_result.hpp"

namespace elm_mcp::tools {

// Placeholder in CompilerOptions::args replaced by the entry file
inline constexpr std::string_view kEntryPlaceholder = "{entry}";

struct CompilerOptions {
  std::string command = "elm";
  std::vector<std::string> args = {
      "make", std::string(kEntryPlaceholder), "--report=json",
      "--output=/dev/null"};
  diagnostics::DiagnosticFormat format = diagnostics::DiagnosticFormat::kElmReport;
  std::chrono::milliseconds timeout = std::chrono::seconds(120);
  std::string entry_file = "src/Main.elm";
};

// Runs tool calls end to end: parse, validate, take the project lock, run,
// shape the result. Every call yields exactly one ToolResult and errors
// carry the tool name.
//
// Each call runs under a deadline. When it passes, or when the awaiting
// coroutine is cancelled, the running handler is cancelled: child processes
// are killed, registry waits abandoned, and the project lock released before
// Execute returns.
class ToolDispatcher {
 public:
  ToolDispatcher(
      asio::any_io_executor executor, std::filesystem::path project_root,
      std::shared_ptr<process::ProcessRunner> runner,
      std::shared_ptr<packages::PackageOperations> operations,
      std::shared_ptr<project::ProjectLock> lock, CompilerOptions compiler,
      std::chrono::milliseconds call_deadline,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Dispatch(std::string_view name, const nlohmann::json& arguments)
      -> asio::awaitable<ToolResult>;

  auto Execute(ToolRequest request) -> asio::awaitable<ToolResult>;

  // Lock taken for a request, if any
  static auto LockModeFor(const ToolRequest& request)
      -> std::optional<project::LockMode>;

 private:
  auto RunLocked(ToolRequest request, project::ProjectLock::Deadline deadline)
      -> asio::awaitable<ToolResult>;

  auto Handle(const ValidateArgs& args) -> asio::awaitable<ToolResult>;
  auto Handle(const AddPackageArgs& args) -> asio::awaitable<ToolResult>;
  auto Handle(const RemovePackageArgs& args) -> asio::awaitable<ToolResult>;
  auto Handle(const SearchPackagesArgs& args) -> asio::awaitable<ToolResult>;
  auto Handle(const GetLatestPackageVersionArgs& args)
      -> asio::awaitable<ToolResult>;
  auto Handle(const GetDocsArgs& args) -> asio::awaitable<ToolResult>;

  // Makes compiler-reported paths relative to the project when inside it
  auto RelativizeFile(const std::string& file) const -> std::string;

  asio::any_io_executor executor_;
  std::filesystem::path project_root_;
  std::shared_ptr<process::ProcessRunner> runner_;
  std::shared_ptr<packages::PackageOperations> operations_;
  std::shared_ptr<project::ProjectLock> lock_;
  CompilerOptions compiler_;
  std::chrono::milliseconds call_deadline_;
  std::shared_ptr<spdlog::logger> logger_;
  diagnostics::DiagnosticsParser parser_;
};

}  // namespace elm_mcp::tools
