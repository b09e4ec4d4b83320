#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace elm_mcp::utils {

// Logs how long an operation took when it goes out of scope, at debug level,
// or at warn level when the operation was marked as failed.
class ScopedTimer {
 public:
  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&) = delete;
  auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
  auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~ScopedTimer();

  void MarkFailed(std::string reason);

  [[nodiscard]] auto Elapsed() const -> std::chrono::milliseconds;

  // "850ms" or "1.2s"
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  std::optional<std::string> failure_;
};

}  // namespace elm_mcp::utils
