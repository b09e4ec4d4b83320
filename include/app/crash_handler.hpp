#pragma once

namespace app {

/// Install handlers for SIGSEGV, SIGFPE, SIGILL, SIGBUS and SIGABRT that
/// print the signal name and a stack trace to stderr, then re-raise
void InitializeCrashHandlers();

/// Ignore SIGPIPE so writes to a closed pipe (a killed child, a vanished
/// client) fail with EPIPE instead of terminating the server
void IgnoreBrokenPipes();

/// Stop with SIGSTOP when WAIT_FOR_GDB is set, so a debugger can attach
void WaitForDebuggerIfRequested();

}  // namespace app
