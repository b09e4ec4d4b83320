#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/error.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <spdlog/spdlog.h>

#include "elm_mcp/error/tool_error.hpp"

namespace elm_mcp::project {

enum class LockMode {
  kShared,
  kExclusive,
};

// Asynchronous FIFO reader/writer lock for the project folder.
//
// - Exclusive holders run alone; shared holders run together
// - Waiters are served in arrival order, so a queued writer holds back
//   readers that arrive after it
// - Acquire honours an optional deadline (kTimedOut) and asio cancellation
//   of the awaiting coroutine (kCancelled); an abandoned waiter leaves the
//   queue immediately
// - Guards release on destruction, whatever path the holder takes
//
// Thread-safe: state is guarded by a mutex and waiters are woken through
// concurrent channels.
class ProjectLock {
 public:
  class Guard {
   public:
    Guard() = default;
    Guard(ProjectLock* lock, LockMode mode) : lock_(lock), mode_(mode) {
    }

    Guard(const Guard&) = delete;
    auto operator=(const Guard&) -> Guard& = delete;

    Guard(Guard&& other) noexcept
        : lock_(std::exchange(other.lock_, nullptr)), mode_(other.mode_) {
    }
    auto operator=(Guard&& other) noexcept -> Guard& {
      if (this != &other) {
        Release();
        lock_ = std::exchange(other.lock_, nullptr);
        mode_ = other.mode_;
      }
      return *this;
    }

    ~Guard() {
      Release();
    }

    [[nodiscard]] auto Owns() const -> bool {
      return lock_ != nullptr;
    }

    [[nodiscard]] auto Mode() const -> LockMode {
      return mode_;
    }

    void Release() {
      if (lock_ != nullptr) {
        std::exchange(lock_, nullptr)->Release(mode_);
      }
    }

   private:
    ProjectLock* lock_ = nullptr;
    LockMode mode_ = LockMode::kShared;
  };

  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  explicit ProjectLock(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ProjectLock(const ProjectLock&) = delete;
  ProjectLock(ProjectLock&&) = delete;
  auto operator=(const ProjectLock&) -> ProjectLock& = delete;
  auto operator=(ProjectLock&&) -> ProjectLock& = delete;
  ~ProjectLock() = default;

  auto Acquire(LockMode mode, Deadline deadline = std::nullopt)
      -> asio::awaitable<std::expected<Guard, ToolError>>;

  // Snapshot for diagnostics and tests
  [[nodiscard]] auto ActiveReaders() const -> int;
  [[nodiscard]] auto HasWriter() const -> bool;
  [[nodiscard]] auto QueueLength() const -> std::size_t;

 private:
  using Signal = asio::experimental::concurrent_channel<void(asio::error_code)>;

  struct Waiter {
    Waiter(asio::any_io_executor executor, LockMode mode)
        : mode(mode), ready(std::move(executor), 1) {
    }
    LockMode mode;
    bool granted = false;
    Signal ready;
  };

  // Caller holds mutex_
  auto CanGrantLocked(LockMode mode) const -> bool;
  void TakeLocked(LockMode mode);
  void GrantWaitersLocked();

  void Release(LockMode mode);

  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  int readers_ = 0;
  bool writer_ = false;
  std::deque<std::shared_ptr<Waiter>> queue_;
};

}  // namespace elm_mcp::project

template <>
struct fmt::formatter<elm_mcp::project::LockMode>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const elm_mcp::project::LockMode& mode, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        mode == elm_mcp::project::LockMode::kShared ? "shared" : "exclusive",
        ctx);
  }
};
