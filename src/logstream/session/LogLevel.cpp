#include <logstream/session/LogLevel.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace LS {

auto to_string(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "INFO";
}

auto parse_log_level(std::string_view text) -> LogLevel {
    std::string upper(text);
    std::ranges::transform(upper, upper.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (upper == "DEBUG") {
        return LogLevel::Debug;
    }
    if (upper == "WARNING" || upper == "WARN") {
        return LogLevel::Warning;
    }
    if (upper == "ERROR") {
        return LogLevel::Error;
    }
    if (upper == "CRITICAL") {
        return LogLevel::Critical;
    }
    return LogLevel::Info;
}

} // namespace LS
