#include "elm_mcp/tools/tool_dispatcher.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include "elm_mcp/utils/path_utils.hpp"
#include "elm_mcp/utils/scoped_timer.hpp"

namespace elm_mcp::tools {

using namespace asio::experimental::awaitable_operators;

ToolDispatcher::ToolDispatcher(
    asio::any_io_executor executor, std::filesystem::path project_root,
    std::shared_ptr<process::ProcessRunner> runner,
    std::shared_ptr<packages::PackageOperations> operations,
    std::shared_ptr<project::ProjectLock> lock, CompilerOptions compiler,
    std::chrono::milliseconds call_deadline,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      project_root_(std::move(project_root)),
      runner_(std::move(runner)),
      operations_(std::move(operations)),
      lock_(std::move(lock)),
      compiler_(std::move(compiler)),
      call_deadline_(call_deadline),
      logger_(logger ? logger : spdlog::default_logger()),
      parser_(logger_) {
}

auto ToolDispatcher::LockModeFor(const ToolRequest& request)
    -> std::optional<project::LockMode> {
  switch (request.name) {
    case ToolName::kValidate:
    case ToolName::kAddPackage:
    case ToolName::kRemovePackage:
      return project::LockMode::kExclusive;
    case ToolName::kGetDocs:
      // Shared while the recorded version is read from the manifest
      if (!std::get<GetDocsArgs>(request.arguments).package.version) {
        return project::LockMode::kShared;
      }
      return std::nullopt;
    case ToolName::kSearchPackages:
    case ToolName::kGetLatestPackageVersion:
      return std::nullopt;
  }
  return std::nullopt;
}

auto ToolDispatcher::Dispatch(
    std::string_view name, const nlohmann::json& arguments)
    -> asio::awaitable<ToolResult> {
  auto request = ParseToolRequest(name, arguments);
  if (!request) {
    logger_->debug(
        "ToolDispatcher rejected call to '{}': {}", name,
        request.error().Message());
    co_return std::unexpected(request.error().WithTool(std::string(name)));
  }
  co_return co_await Execute(std::move(*request));
}

auto ToolDispatcher::Execute(ToolRequest request)
    -> asio::awaitable<ToolResult> {
  // Cancellation is reported through results from here down, not thrown
  co_await asio::this_coro::throw_if_cancelled(false);

  const auto tool = std::string(ToolNameToString(request.name));
  utils::ScopedTimer timer(fmt::format("Tool {}", tool), logger_);

  const auto deadline = std::chrono::steady_clock::now() + call_deadline_;
  asio::steady_timer deadline_timer(executor_, deadline);

  auto race = co_await (
      RunLocked(std::move(request), deadline) ||
      deadline_timer.async_wait(asio::as_tuple(asio::use_awaitable)));

  auto state = co_await asio::this_coro::cancellation_state;
  ToolResult result;
  if (state.cancelled() != asio::cancellation_type::none) {
    result = ToolError::UnexpectedFromKind(
        ToolErrorKind::kCancelled, fmt::format("'{}' was cancelled", tool));
  } else if (race.index() == 1) {
    result = ToolError::UnexpectedFromKind(
        ToolErrorKind::kTimedOut,
        fmt::format(
            "'{}' did not finish within {}", tool,
            utils::ScopedTimer::FormatDuration(call_deadline_)));
  } else {
    result = std::move(std::get<0>(race));
  }

  if (!result) {
    result = std::unexpected(result.error().WithTool(tool));
    if (result.error().Kind() == ToolErrorKind::kInternal) {
      logger_->error("Tool {} failed: {}", tool, result.error().Message());
    }
    timer.MarkFailed(fmt::format(
        "{} ({})", result.error().Message(), result.error().Kind()));
  }
  co_return result;
}

auto ToolDispatcher::RunLocked(
    ToolRequest request, project::ProjectLock::Deadline deadline)
    -> asio::awaitable<ToolResult> {
  // Branch of the deadline race: cancellation shows up in results
  co_await asio::this_coro::throw_if_cancelled(false);

  project::ProjectLock::Guard guard;
  if (auto mode = LockModeFor(request)) {
    auto acquired = co_await lock_->Acquire(*mode, deadline);
    if (!acquired) {
      co_return std::unexpected(acquired.error());
    }
    guard = std::move(*acquired);
    logger_->debug(
        "ToolDispatcher holds {} lock for {}", *mode, request.name);
  }

  // get_docs needs the lock only to read the recorded version
  if (auto* docs = std::get_if<GetDocsArgs>(&request.arguments);
      docs != nullptr && guard.Owns()) {
    docs->package.version = operations_->RecordedVersion(docs->package);
    guard.Release();
  }

  co_return co_await std::visit(
      [this](const auto& args) { return Handle(args); }, request.arguments);
}

auto ToolDispatcher::RelativizeFile(const std::string& file) const
    -> std::string {
  std::filesystem::path path(file);
  if (!path.is_absolute()) {
    return file;
  }
  auto relative = path.lexically_normal().lexically_relative(project_root_);
  if (relative.empty() || *relative.begin() == "..") {
    return file;
  }
  return relative.generic_string();
}

auto ToolDispatcher::Handle(const ValidateArgs& args)
    -> asio::awaitable<ToolResult> {
  const auto& entry = args.entry_file ? *args.entry_file : compiler_.entry_file;
  auto entry_path = ResolveWithinRoot(project_root_, entry);
  if (entry_path.empty()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInvalidArguments,
        fmt::format("'{}' is not a path inside the project", entry));
  }
  if (!IsElmFile(entry_path)) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInvalidArguments,
        fmt::format("'{}' is not an Elm module", entry));
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(entry_path, ec)) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kNotFound,
        fmt::format("Entry file '{}' does not exist", entry));
  }

  const auto relative_entry =
      entry_path.lexically_relative(project_root_).generic_string();
  std::vector<std::string> compiler_args;
  compiler_args.reserve(compiler_.args.size());
  for (const auto& arg : compiler_.args) {
    compiler_args.push_back(arg == kEntryPlaceholder ? relative_entry : arg);
  }

  auto output = co_await runner_->Run(process::ProcessRequest{
      .program = compiler_.command,
      .args = std::move(compiler_args),
      .working_dir = project_root_,
      .timeout = compiler_.timeout,
      .stdin_data = std::nullopt,
  });
  if (!output) {
    co_return std::unexpected(output.error());
  }

  auto report = parser_.Parse(*output, compiler_.format);
  for (auto& diagnostic : report.diagnostics) {
    diagnostic.file = RelativizeFile(diagnostic.file);
  }
  // Relative and absolute paths order differently
  diagnostics::SortDiagnostics(report.diagnostics);
  logger_->debug(
      "ToolDispatcher validate: exit {}, {} diagnostic(s){}", output->exit_code,
      report.diagnostics.size(), report.used_fallback ? " (fallback)" : "");

  co_return ValidateResult{
      .diagnostics = std::move(report.diagnostics),
      .dropped_records = report.dropped_records,
  };
}

auto ToolDispatcher::Handle(const AddPackageArgs& args)
    -> asio::awaitable<ToolResult> {
  auto added = co_await operations_->AddPackage(args.package, args.test);
  if (!added) {
    co_return std::unexpected(added.error());
  }
  co_return std::move(*added);
}

auto ToolDispatcher::Handle(const RemovePackageArgs& args)
    -> asio::awaitable<ToolResult> {
  auto removed = co_await operations_->RemovePackage(args.package, args.test);
  if (!removed) {
    co_return std::unexpected(removed.error());
  }
  co_return RemovePackageResult{.package = std::move(*removed)};
}

auto ToolDispatcher::Handle(const SearchPackagesArgs& args)
    -> asio::awaitable<ToolResult> {
  auto found = co_await operations_->SearchPackages(args.query, args.limit);
  if (!found) {
    co_return std::unexpected(found.error());
  }
  co_return SearchPackagesResult{.packages = std::move(*found)};
}

auto ToolDispatcher::Handle(const GetLatestPackageVersionArgs& args)
    -> asio::awaitable<ToolResult> {
  auto latest = co_await operations_->GetLatestVersion(args.author, args.name);
  if (!latest) {
    co_return std::unexpected(latest.error());
  }
  co_return GetLatestPackageVersionResult{.package = std::move(*latest)};
}

auto ToolDispatcher::Handle(const GetDocsArgs& args)
    -> asio::awaitable<ToolResult> {
  auto docs = co_await operations_->GetDocs(args.package, args.module, args.symbol);
  if (!docs) {
    co_return std::unexpected(docs.error());
  }
  co_return std::move(*docs);
}

}  // namespace elm_mcp::tools
