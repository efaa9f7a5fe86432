#pragma once

#include <atomic>

namespace LS::Runtime {

// Process-wide shutdown flag. Once raised in production it is never lowered;
// every long-lived loop (monitor threads, log streams, the server loop)
// observes it at each iteration boundary.
auto shutdown_flag() -> std::atomic<bool>&;

// Async-signal-safe; installed as the SIGINT/SIGTERM action by the server tool.
void RequestShutdown();

[[nodiscard]] auto ShutdownRequested() -> bool;

// Tests only.
void ResetShutdownFlag();

} // namespace LS::Runtime
