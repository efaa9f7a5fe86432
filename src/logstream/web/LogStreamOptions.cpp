#include <logstream/web/LogStreamOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace LS::Web {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

// Accepted range and message for each integer setting, shared by the
// environment and the command line.
struct IntegerSetting {
    char const*   env_key;
    char const*   flag;
    std::int64_t  LogStreamOptions::*field;
    std::int64_t  min;
    std::int64_t  max;
    char const*   message;
};

constexpr IntegerSetting kIntegerSettings[] = {
    {"LOGSTREAM_IDLE_TIMEOUT", "--idle-timeout", &LogStreamOptions::default_idle_timeout_seconds,
     kMinIdleTimeoutSeconds, kMaxIdleTimeoutSeconds, "must be within 10-3600"},
    {"LOGSTREAM_MONITOR_INTERVAL", "--monitor-interval", &LogStreamOptions::default_monitor_interval_seconds,
     kMinMonitorIntervalSeconds, kMaxMonitorIntervalSeconds, "must be within 1-3600"},
    {"LOGSTREAM_MONITOR_STOP_GRACE_MS", "--monitor-stop-grace-ms", &LogStreamOptions::monitor_stop_grace_ms,
     0, 60000, "must be within 0-60000"},
    {"LOGSTREAM_POLL_INTERVAL_MS", "--poll-interval-ms", &LogStreamOptions::poll_interval_ms,
     1, 10000, "must be within 1-10000"},
};

} // namespace

bool IsValidLogStreamPort(int port) {
    return port >= 0 && port <= 65535;
}

auto ValidateLogStreamOptions(LogStreamOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidLogStreamPort(options.port)) {
        return std::string{"--port must be within 0-65535"};
    }
    if (options.logs_dir.empty()) {
        return std::string{"--logs-dir must not be empty"};
    }
    for (auto const& setting : kIntegerSettings) {
        auto const value = options.*(setting.field);
        if (value < setting.min || value > setting.max) {
            return std::string{setting.flag} + ' ' + setting.message;
        }
    }
    return std::nullopt;
}

bool ApplyLogStreamEnvOverrides(LogStreamOptions& options) {
    if (!apply_env("LOGSTREAM_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "LOGSTREAM_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("LOGSTREAM_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
                std::cerr << "LOGSTREAM_PORT must be within 0-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("LOGSTREAM_LOGS_DIR", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "LOGSTREAM_LOGS_DIR must not be empty\n";
                return false;
            }
            options.logs_dir = std::string{value};
            return true;
        })) {
        return false;
    }

    for (auto const& setting : kIntegerSettings) {
        if (!apply_env(setting.env_key, [&](std::string_view value) {
                std::int64_t parsed = options.*(setting.field);
                if (!parse_integer_in_range<std::int64_t>(value, setting.min, setting.max, parsed)) {
                    std::cerr << setting.env_key << ' ' << setting.message << "\n";
                    return false;
                }
                options.*(setting.field) = parsed;
                return true;
            })) {
            return false;
        }
    }

    if (!apply_env("LOGSTREAM_QUIET", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "LOGSTREAM_QUIET must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.quiet = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintLogStreamUsage() {
    std::cout << "Usage: logstream_server [options]\n"
              << "  --host <host>                 Bind address (default 127.0.0.1)\n"
              << "  --port <port>                 Bind port, 0 for any free port (default 8000)\n"
              << "  --logs-dir <path>             Directory for session logs (default logs)\n"
              << "  --idle-timeout <sec>          Default stream idle timeout, 10-3600 (default 300)\n"
              << "  --monitor-interval <sec>      Default monitor interval, 1-3600 (default 2)\n"
              << "  --monitor-stop-grace-ms <ms>  Wait for a monitor to exit on stop (default 2000)\n"
              << "  --poll-interval-ms <ms>       Stream poll interval (default 100)\n"
              << "  --quiet                       Disable diagnostic logging\n"
              << "  --help                        Show this help\n";
}

std::optional<LogStreamOptions> ParseLogStreamArguments(int argc, char** argv) {
    LogStreamOptions options{};
    if (!ApplyLogStreamEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto const integer = std::find_if(std::begin(kIntegerSettings), std::end(kIntegerSettings),
                                          [&](IntegerSetting const& setting) { return arg == setting.flag; });
        if (integer != std::end(kIntegerSettings)) {
            auto value = require_value(i, integer->flag);
            if (!value) {
                return std::nullopt;
            }
            std::int64_t parsed = options.*(integer->field);
            if (!parse_integer_in_range<std::int64_t>(*value, integer->min, integer->max, parsed)) {
                std::cerr << integer->flag << ' ' << integer->message << "\n";
                return std::nullopt;
            }
            options.*(integer->field) = parsed;
        } else if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 0, 65535, parsed)) {
                    std::cerr << "--port must be within 0-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--logs-dir") {
            if (auto value = require_value(i, "--logs-dir")) {
                if (value->empty()) {
                    std::cerr << "--logs-dir must not be empty\n";
                    return std::nullopt;
                }
                options.logs_dir = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateLogStreamOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace LS::Web
