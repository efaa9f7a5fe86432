#pragma once

#include <chrono>
#include <string>

namespace LS {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z.
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Local time in the session log prefix layout, e.g. 2024-05-01 12:00:00,000.
auto format_log_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

} // namespace LS
