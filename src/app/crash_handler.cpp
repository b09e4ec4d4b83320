#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\nelm-mcp: fatal signal " << sig << " (" << ::strsignal(sig)
            << ")\n";

  try {
    std::cerr << "Stack trace:\n" << std::stacktrace::current() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Stack trace unavailable: " << e.what() << "\n";
  }

  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (int sig : {SIGSEGV, SIGFPE, SIGILL, SIGBUS, SIGABRT}) {
    std::signal(sig, HandleFatalSignal);
  }
#endif
}

void IgnoreBrokenPipes() {
#ifdef __linux__
  std::signal(SIGPIPE, SIG_IGN);
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv("WAIT_FOR_GDB") != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app
