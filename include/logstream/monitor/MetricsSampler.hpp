#pragma once

#include <logstream/core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LS::Monitor {

struct ProcessUsage {
    std::string name;
    int         pid         = 0;
    double      ram_percent = 0.0;
};

struct MetricsSample {
    double                    ram_percent = 0.0;
    std::optional<double>     load1;
    std::optional<double>     load5;
    std::optional<double>     load15;
    double                    cpu_percent       = 0.0;
    std::uint64_t             process_rss_bytes = 0;
    std::vector<ProcessUsage> top_processes; // descending by ram_percent, at most 5
};

inline constexpr std::size_t kMaxTopProcesses = 5;

// Source of host metrics for the monitor loop. Implementations may be slow
// (tens of milliseconds) and may fail; failures are reported as SamplingFault.
class MetricsSampler {
public:
    virtual ~MetricsSampler() = default;

    virtual auto sample() -> Expected<MetricsSample> = 0;
};

} // namespace LS::Monitor
