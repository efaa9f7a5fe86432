#include <logstream/util/TimeUtils.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace LS {

namespace {

auto split_millis(std::chrono::system_clock::time_point tp, std::time_t& seconds) -> long long {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (seconds_part > tp) {
        seconds_part -= std::chrono::seconds{1};
    }
    seconds = std::chrono::system_clock::to_time_t(seconds_part);
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part).count();
}

} // namespace

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    std::time_t raw{};
    auto        millis = split_millis(tp, raw);
    std::tm     tm{};
    if (gmtime_r(&raw, &tm) == nullptr) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis;
    oss << 'Z';
    return oss.str();
}

auto format_log_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    std::time_t raw{};
    auto        millis = split_millis(tp, raw);
    std::tm     tm{};
    if (localtime_r(&raw, &tm) == nullptr) {
        return "1970-01-01 00:00:00,000";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << ',' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // namespace LS
