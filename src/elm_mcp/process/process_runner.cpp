#include "elm_mcp/process/process_runner.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "elm_mcp/utils/scoped_timer.hpp"

namespace elm_mcp::process {

using namespace asio::experimental::awaitable_operators;

namespace {

constexpr std::size_t kReadChunkSize = 64 * 1024;
constexpr auto kMinReapInterval = std::chrono::milliseconds(1);
constexpr auto kMaxReapInterval = std::chrono::milliseconds(25);
constexpr int kExecFailedExitCode = 127;

// Both ends close-on-exec; dup2 in the child clears the flag on the copy
class Pipe {
 public:
  Pipe() = default;
  Pipe(const Pipe&) = delete;
  auto operator=(const Pipe&) -> Pipe& = delete;
  Pipe(Pipe&&) = delete;
  auto operator=(Pipe&&) -> Pipe& = delete;

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  auto Open() -> bool {
    return ::pipe2(fds_.data(), O_CLOEXEC) == 0;
  }

  [[nodiscard]] auto ReadEnd() const -> int {
    return fds_[0];
  }
  [[nodiscard]] auto WriteEnd() const -> int {
    return fds_[1];
  }

  // Hands the read end over to a new owner
  auto ReleaseRead() -> int {
    return std::exchange(fds_[0], -1);
  }
  auto ReleaseWrite() -> int {
    return std::exchange(fds_[1], -1);
  }

  void CloseRead() {
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  std::array<int, 2> fds_{-1, -1};
};

// Owns a spawned child. Whatever path leaves Run, the child's process group
// is killed and the pid reaped exactly once.
class ChildProcess {
 public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {
  }

  ChildProcess(const ChildProcess&) = delete;
  auto operator=(const ChildProcess&) -> ChildProcess& = delete;
  ChildProcess(ChildProcess&&) = delete;
  auto operator=(ChildProcess&&) -> ChildProcess& = delete;

  ~ChildProcess() {
    if (!reaped_) {
      KillGroup();
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  void KillGroup() const {
    // Negative pid targets the group the child leads
    if (::kill(-pid_, SIGKILL) != 0) {
      ::kill(pid_, SIGKILL);
    }
  }

  // Non-blocking; returns the exit code once the child has terminated
  auto TryReap() -> std::optional<int> {
    if (reaped_) {
      return exit_code_;
    }
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0 || (result < 0 && errno == EINTR)) {
      return std::nullopt;
    }
    reaped_ = true;
    if (result < 0) {
      exit_code_ = -1;
    } else if (WIFEXITED(status)) {
      exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code_ = 128 + WTERMSIG(status);
    } else {
      exit_code_ = -1;
    }
    return exit_code_;
  }

  void ReapBlocking() {
    if (reaped_) {
      return;
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
  }

  [[nodiscard]] auto Pid() const -> pid_t {
    return pid_;
  }

 private:
  pid_t pid_;
  bool reaped_ = false;
  int exit_code_ = -1;
};

auto ReadAll(asio::posix::stream_descriptor& pipe, std::string& sink)
    -> asio::awaitable<void> {
  std::array<char, kReadChunkSize> buffer{};
  for (;;) {
    auto [ec, n] = co_await pipe.async_read_some(
        asio::buffer(buffer), asio::as_tuple(asio::use_awaitable));
    sink.append(buffer.data(), n);
    if (ec) {
      // EOF, or the drain was cancelled
      co_return;
    }
  }
}

auto WriteAndClose(asio::posix::stream_descriptor& pipe, const std::string& data)
    -> asio::awaitable<void> {
  // EPIPE just means the child stopped reading; its exit status tells the rest
  co_await asio::async_write(
      pipe, asio::buffer(data), asio::as_tuple(asio::use_awaitable));
  asio::error_code ignored;
  pipe.close(ignored);
}

auto IsCancelled() -> asio::awaitable<bool> {
  auto state = co_await asio::this_coro::cancellation_state;
  co_return state.cancelled() != asio::cancellation_type::none;
}

}  // namespace

ProcessRunner::ProcessRunner(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto ProcessRunner::Run(ProcessRequest request)
    -> asio::awaitable<std::expected<ProcessOutput, ToolError>> {
  if (request.timeout <= std::chrono::milliseconds::zero()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kInvalidArguments,
        fmt::format("No timeout given for '{}'", request.program));
  }
  if (request.program.empty()) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kSpawnFailed, "Empty program name");
  }

  std::error_code fs_ec;
  if (!std::filesystem::is_directory(request.working_dir, fs_ec)) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kSpawnFailed,
        fmt::format(
            "Working directory does not exist: {}",
            request.working_dir.string()));
  }

  utils::ScopedTimer timer(fmt::format("Process '{}'", request.program), logger_);

  // Everything the child touches is prepared before fork
  std::vector<std::string> argv_storage;
  argv_storage.reserve(request.args.size() + 1);
  argv_storage.push_back(request.program);
  argv_storage.insert(
      argv_storage.end(), request.args.begin(), request.args.end());
  std::vector<char*> argv;
  argv.reserve(argv_storage.size() + 1);
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const std::string working_dir = request.working_dir.string();

  Pipe stdin_pipe;
  Pipe stdout_pipe;
  Pipe stderr_pipe;
  Pipe status_pipe;
  if (!stdout_pipe.Open() || !stderr_pipe.Open() || !status_pipe.Open() ||
      (request.stdin_data && !stdin_pipe.Open())) {
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kSpawnFailed,
        fmt::format("Failed to create pipes: {}", std::strerror(errno)));
  }

  int devnull = -1;
  if (!request.stdin_data) {
    devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kSpawnFailed,
          fmt::format("Failed to open /dev/null: {}", std::strerror(errno)));
    }
  }

  logger_->debug(
      "ProcessRunner spawning '{}' ({} args) in {} (timeout {}ms)",
      request.program, request.args.size(), working_dir,
      request.timeout.count());

  const pid_t pid = ::fork();
  if (pid < 0) {
    int fork_errno = errno;
    if (devnull >= 0) {
      ::close(devnull);
    }
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kSpawnFailed,
        fmt::format("fork failed: {}", std::strerror(fork_errno)));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only
    ::setpgid(0, 0);
    const int stdin_fd = request.stdin_data ? stdin_pipe.ReadEnd() : devnull;
    if (::dup2(stdin_fd, STDIN_FILENO) < 0 ||
        ::dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO) < 0 ||
        ::dup2(stderr_pipe.WriteEnd(), STDERR_FILENO) < 0 ||
        ::chdir(working_dir.c_str()) != 0) {
      int err = errno;
      [[maybe_unused]] auto written =
          ::write(status_pipe.WriteEnd(), &err, sizeof(err));
      ::_exit(kExecFailedExitCode);
    }
    ::execvp(argv[0], argv.data());
    int err = errno;
    [[maybe_unused]] auto written =
        ::write(status_pipe.WriteEnd(), &err, sizeof(err));
    ::_exit(kExecFailedExitCode);
  }

  // Parent. Setting the group here as well closes the race with the child.
  ::setpgid(pid, pid);
  ChildProcess child(pid);

  if (devnull >= 0) {
    ::close(devnull);
  }
  stdin_pipe.CloseRead();
  stdout_pipe.CloseWrite();
  stderr_pipe.CloseWrite();
  status_pipe.CloseWrite();

  // The status pipe closes on a successful exec and carries errno otherwise
  int exec_errno = 0;
  ssize_t status_read = 0;
  do {
    status_read = ::read(status_pipe.ReadEnd(), &exec_errno, sizeof(exec_errno));
  } while (status_read < 0 && errno == EINTR);
  if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
    child.ReapBlocking();
    logger_->warn(
        "ProcessRunner failed to start '{}': {}", request.program,
        std::strerror(exec_errno));
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kSpawnFailed,
        fmt::format(
            "Failed to execute '{}': {}", request.program,
            std::strerror(exec_errno)));
  }

  asio::posix::stream_descriptor out_stream(executor_, stdout_pipe.ReleaseRead());
  asio::posix::stream_descriptor err_stream(executor_, stderr_pipe.ReleaseRead());

  ProcessOutput output;
  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  asio::steady_timer deadline_timer(executor_, deadline);

  auto drain = [&]() -> asio::awaitable<void> {
    if (request.stdin_data) {
      asio::posix::stream_descriptor in_stream(
          executor_, stdin_pipe.ReleaseWrite());
      co_await (
          WriteAndClose(in_stream, *request.stdin_data) &&
          ReadAll(out_stream, output.stdout_data) &&
          ReadAll(err_stream, output.stderr_data));
    } else {
      co_await (
          ReadAll(out_stream, output.stdout_data) &&
          ReadAll(err_stream, output.stderr_data));
    }
  };

  auto race = co_await (
      drain() ||
      deadline_timer.async_wait(asio::as_tuple(asio::use_awaitable)));

  if (co_await IsCancelled()) {
    child.KillGroup();
    logger_->debug("ProcessRunner cancelled '{}'", request.program);
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kCancelled,
        fmt::format("'{}' was cancelled", request.program));
  }

  if (race.index() == 1) {
    child.KillGroup();
    logger_->warn(
        "ProcessRunner killed '{}' after {}ms", request.program,
        request.timeout.count());
    co_return ToolError::UnexpectedFromKind(
        ToolErrorKind::kTimedOut,
        fmt::format(
            "'{}' exceeded its {}ms time budget", request.program,
            request.timeout.count()));
  }

  // Both pipes hit EOF; the child is exiting. Poll for its status without
  // blocking the io_context.
  auto interval = kMinReapInterval;
  asio::steady_timer reap_timer(executor_);
  for (;;) {
    if (auto code = child.TryReap()) {
      output.exit_code = *code;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      child.KillGroup();
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kTimedOut,
          fmt::format(
              "'{}' closed its output but did not exit within {}ms",
              request.program, request.timeout.count()));
    }
    if (co_await IsCancelled()) {
      child.KillGroup();
      co_return ToolError::UnexpectedFromKind(
          ToolErrorKind::kCancelled,
          fmt::format("'{}' was cancelled", request.program));
    }
    reap_timer.expires_after(interval);
    co_await reap_timer.async_wait(asio::as_tuple(asio::use_awaitable));
    interval = std::min(interval * 2, kMaxReapInterval);
  }

  logger_->debug(
      "ProcessRunner '{}' exited with {} ({} bytes stdout, {} bytes stderr)",
      request.program, output.exit_code, output.stdout_data.size(),
      output.stderr_data.size());

  co_return output;
}

}  // namespace elm_mcp::process
