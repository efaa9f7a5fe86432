#pragma once

#include <logstream/monitor/MetricsSampler.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>

namespace LS::Monitor {

// Linux sampler reading procfs. CPU usage of this process is derived from the
// utime+stime delta between consecutive samples, so the first sample of a
// fresh sampler reports 0%.
class ProcMetricsSampler final : public MetricsSampler {
public:
    explicit ProcMetricsSampler(std::filesystem::path proc_root = "/proc");

    auto sample() -> Expected<MetricsSample> override;

private:
    struct CpuMark {
        std::chrono::steady_clock::time_point at;
        double                                cpu_seconds = 0.0;
    };

    std::filesystem::path  proc_root_;
    std::mutex             mutex_;
    std::optional<CpuMark> last_cpu_;
};

} // namespace LS::Monitor
