#include "elm_mcp/project/project_lock.hpp"

#include <algorithm>

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace elm_mcp::project {

using namespace asio::experimental::awaitable_operators;

ProjectLock::ProjectLock(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto ProjectLock::CanGrantLocked(LockMode mode) const -> bool {
  if (mode == LockMode::kExclusive) {
    return !writer_ && readers_ == 0;
  }
  return !writer_;
}

void ProjectLock::TakeLocked(LockMode mode) {
  if (mode == LockMode::kExclusive) {
    writer_ = true;
  } else {
    ++readers_;
  }
}

void ProjectLock::GrantWaitersLocked() {
  while (!queue_.empty()) {
    auto& next = queue_.front();
    if (!CanGrantLocked(next->mode)) {
      break;
    }
    TakeLocked(next->mode);
    next->granted = true;
    next->ready.try_send(asio::error_code{});
    const bool exclusive = next->mode == LockMode::kExclusive;
    queue_.pop_front();
    if (exclusive) {
      break;
    }
  }
}

void ProjectLock::Release(LockMode mode) {
  std::scoped_lock lock(mutex_);
  if (mode == LockMode::kExclusive) {
    writer_ = false;
  } else {
    --readers_;
  }
  GrantWaitersLocked();
}

auto ProjectLock::Acquire(LockMode mode, Deadline deadline)
    -> asio::awaitable<std::expected<Guard, ToolError>> {
  auto waiter = std::make_shared<Waiter>(executor_, mode);
  {
    std::scoped_lock lock(mutex_);
    if (queue_.empty() && CanGrantLocked(mode)) {
      TakeLocked(mode);
      co_return Guard(this, mode);
    }
    queue_.push_back(waiter);
    logger_->debug(
        "ProjectLock: {} request queued behind {} waiter(s)", mode,
        queue_.size() - 1);
  }

  if (deadline) {
    asio::steady_timer timer(executor_, *deadline);
    co_await (
        waiter->ready.async_receive(asio::as_tuple(asio::use_awaitable)) ||
        timer.async_wait(asio::as_tuple(asio::use_awaitable)));
  } else {
    co_await waiter->ready.async_receive(asio::as_tuple(asio::use_awaitable));
  }

  auto state = co_await asio::this_coro::cancellation_state;
  const bool cancelled = state.cancelled() != asio::cancellation_type::none;

  {
    std::scoped_lock lock(mutex_);
    if (waiter->granted) {
      if (!cancelled) {
        co_return Guard(this, mode);
      }
    } else {
      std::erase(queue_, waiter);
      // A departing writer may have been holding back readers
      GrantWaitersLocked();
    }
  }

  if (waiter->granted) {
    // Granted while the caller was going away; hand it straight back
    Release(mode);
  }

  if (cancelled) {
    logger_->debug("ProjectLock: {} request cancelled", mode);
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kCancelled, "Cancelled while waiting for the project");
  }
  logger_->debug("ProjectLock: {} request timed out", mode);
  co_return ToolError::UnexpectedFromKind(
      ToolErrorKind::kTimedOut, "Timed out waiting for the project");
}

auto ProjectLock::ActiveReaders() const -> int {
  std::scoped_lock lock(mutex_);
  return readers_;
}

auto ProjectLock::HasWriter() const -> bool {
  std::scoped_lock lock(mutex_);
  return writer_;
}

auto ProjectLock::QueueLength() const -> std::size_t {
  std::scoped_lock lock(mutex_);
  return queue_.size();
}

}  // namespace elm_mcp::project
