#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/error/tool_error.hpp"

namespace elm_mcp::process {

struct ProcessRequest {
  std::string program;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  // Mandatory wall-clock budget, must be positive
  std::chrono::milliseconds timeout{0};
  // Written to the child's stdin, which is then closed. Without it the
  // child reads from /dev/null.
  std::optional<std::string> stdin_data;
};

struct ProcessOutput {
  int exit_code = 0;
  std::string stdout_data;
  std::string stderr_data;
};

// Runs one external program per call.
//
// - The child gets its own process group; timeout and cancellation kill the
//   whole group with SIGKILL and reap the child
// - stdout and stderr are drained concurrently, so neither pipe can fill up
//   and stall the child
// - Errors: kSpawnFailed (missing binary, bad working dir), kTimedOut,
//   kCancelled (asio cancellation of the awaiting coroutine),
//   kInvalidArguments (no timeout)
//
// Run is virtual so tests can substitute canned process behaviour.
class ProcessRunner {
 public:
  explicit ProcessRunner(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner(ProcessRunner&&) = delete;
  auto operator=(const ProcessRunner&) -> ProcessRunner& = delete;
  auto operator=(ProcessRunner&&) -> ProcessRunner& = delete;

  virtual ~ProcessRunner() = default;

  virtual auto Run(ProcessRequest request)
      -> asio::awaitable<std::expected<ProcessOutput, ToolError>>;

 protected:
  auto Logger() const -> const std::shared_ptr<spdlog::logger>& {
    return logger_;
  }

  auto Executor() const -> const asio::any_io_executor& {
    return executor_;
  }

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace elm_mcp::process
