#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace LS::Web {

inline constexpr std::int64_t kMinIdleTimeoutSeconds     = 10;
inline constexpr std::int64_t kMaxIdleTimeoutSeconds     = 3600;
inline constexpr std::int64_t kMinMonitorIntervalSeconds = 1;
inline constexpr std::int64_t kMaxMonitorIntervalSeconds = 3600;

struct LogStreamOptions {
    std::string  host{"127.0.0.1"};
    int          port{8000};
    std::string  logs_dir{"logs"};
    std::int64_t default_idle_timeout_seconds{300};
    std::int64_t default_monitor_interval_seconds{2};
    std::int64_t monitor_stop_grace_ms{2000};
    std::int64_t poll_interval_ms{100};
    bool         quiet{false};
    bool         show_help{false};
};

// Defaults, then LOGSTREAM_* environment overrides, then command line flags.
auto ParseLogStreamArguments(int argc, char** argv) -> std::optional<LogStreamOptions>;

void PrintLogStreamUsage();

bool ApplyLogStreamEnvOverrides(LogStreamOptions& options);

auto ValidateLogStreamOptions(LogStreamOptions const& options) -> std::optional<std::string>;

// 0 asks the OS for a free port.
bool IsValidLogStreamPort(int port);

} // namespace LS::Web
