#include <logstream/monitor/MessageClassifier.hpp>

#include <array>
#include <cstdio>
#include <string_view>

namespace LS::Monitor {

namespace {

constexpr double kCriticalRam  = 95.0;
constexpr double kErrorRam     = 90.0;
constexpr double kWarningRam   = 80.0;
constexpr double kCriticalLoad = 8.0;
constexpr double kErrorLoad    = 4.0;
constexpr double kWarningLoad  = 2.0;
constexpr double kWarningCpu   = 50.0;

constexpr std::array<std::string_view, 4> kGenericErrors{
    "Failed to process request due to resource limitations",
    "Background task terminated unexpectedly",
    "Database connection timeout",
    "Cache synchronization failed",
};

constexpr std::array<std::string_view, 4> kGenericCritical{
    "Application service crashed",
    "Database connection pool exhausted",
    "Disk I/O error detected",
    "Network connectivity lost",
};

auto fixed(double value, int precision) -> std::string {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

auto load_text(std::optional<double> const& load) -> std::string {
    return load ? fixed(*load, 2) : std::string{"N/A"};
}

auto above(std::optional<double> const& value, double threshold) -> bool {
    return value && *value > threshold;
}

template <std::size_t N>
auto pick_one(std::array<std::string_view, N> const& choices, std::mt19937& rng) -> std::string {
    std::uniform_int_distribution<std::size_t> dist{0, N - 1};
    return std::string{choices[dist(rng)]};
}

auto stats_report(MetricsSample const& sample) -> std::string {
    std::string report = "SYSTEM STATS:\n";
    report += "  RAM: " + fixed(sample.ram_percent, 1) + "%\n";
    report += "  Load Average: " + load_text(sample.load1) + " (1m), " + load_text(sample.load5) + " (5m), "
              + load_text(sample.load15) + " (15m)\n";
    report += "  Process: " + fixed(static_cast<double>(sample.process_rss_bytes) / 1024.0 / 1024.0, 2)
              + " MB, CPU: " + fixed(sample.cpu_percent, 1) + "%";
    if (!sample.top_processes.empty()) {
        report += "\n  Top Memory Usage:";
        std::size_t index = 0;
        for (auto const& process : sample.top_processes) {
            if (index == kMaxTopProcesses) {
                break;
            }
            ++index;
            report += "\n    " + std::to_string(index) + ". " + process.name + " (PID: " + std::to_string(process.pid)
                      + "): " + fixed(process.ram_percent, 2) + "%";
        }
    }
    return report;
}

} // namespace

auto classify_severity(MetricsSample const& sample) -> LogLevel {
    if (sample.ram_percent > kCriticalRam || above(sample.load1, kCriticalLoad)) {
        return LogLevel::Critical;
    }
    if (sample.ram_percent > kErrorRam || above(sample.load1, kErrorLoad)) {
        return LogLevel::Error;
    }
    if (sample.ram_percent > kWarningRam || above(sample.load1, kWarningLoad) || sample.cpu_percent > kWarningCpu) {
        return LogLevel::Warning;
    }
    return LogLevel::Info;
}

auto pick_weighted_level(std::mt19937& rng) -> LogLevel {
    static constexpr std::array<LogLevel, 3> levels{LogLevel::Info, LogLevel::Warning, LogLevel::Error};
    std::discrete_distribution<std::size_t>  weights{0.7, 0.2, 0.1};
    return levels[weights(rng)];
}

auto describe_sample(LogLevel family, MetricsSample const& sample, std::mt19937& rng) -> std::string {
    switch (family) {
    case LogLevel::Critical:
        if (sample.ram_percent > kCriticalRam) {
            return "System memory exhausted: " + fixed(sample.ram_percent, 1) + "%";
        }
        if (above(sample.load1, kCriticalLoad)) {
            return "System severely overloaded: " + fixed(*sample.load1, 2);
        }
        return pick_one(kGenericCritical, rng);
    case LogLevel::Error:
        if (sample.ram_percent > kErrorRam) {
            return "Critical memory pressure: " + fixed(sample.ram_percent, 1) + "%";
        }
        if (above(sample.load1, kErrorLoad)) {
            return "System overloaded: " + fixed(*sample.load1, 2);
        }
        return pick_one(kGenericErrors, rng);
    case LogLevel::Warning:
        if (sample.ram_percent > kWarningRam) {
            return "High memory usage detected: " + fixed(sample.ram_percent, 1) + "%";
        }
        if (above(sample.load1, kWarningLoad)) {
            return "High system load detected: " + fixed(*sample.load1, 2);
        }
        if (sample.cpu_percent > kWarningCpu) {
            return "High CPU usage detected: " + fixed(sample.cpu_percent, 1) + "%";
        }
        return "Potential resource contention.\n  RAM: " + fixed(sample.ram_percent, 1) + "%\n  Load: "
               + load_text(sample.load1);
    case LogLevel::Debug:
    case LogLevel::Info:
        break;
    }
    return stats_report(sample);
}

auto compose_message(MetricsSample const& sample, std::mt19937& rng) -> MonitorMessage {
    auto level = pick_weighted_level(rng);
    if (classify_severity(sample) == LogLevel::Critical) {
        level = LogLevel::Critical;
    }
    return MonitorMessage{level, describe_sample(level, sample, rng)};
}

} // namespace LS::Monitor
