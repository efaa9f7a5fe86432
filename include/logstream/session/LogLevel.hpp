#pragma once

#include <string_view>

namespace LS {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] auto to_string(LogLevel level) -> std::string_view;

// Case-insensitive; anything unrecognised maps to Info.
[[nodiscard]] auto parse_log_level(std::string_view text) -> LogLevel;

} // namespace LS
