#pragma once

#include <logstream/monitor/MetricsSampler.hpp>
#include <logstream/session/LogSink.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace LS::Monitor {

struct MonitorOptions {
    // Each sleep is interval +/- jitter, clamped at zero.
    std::chrono::milliseconds jitter{500};
    // How long stop() waits for the loop to exit before detaching it.
    std::chrono::milliseconds stop_grace{2000};
    // Fixed seed for reproducible level picks; 0 seeds from std::random_device.
    std::uint32_t seed = 0;
};

// Background producer bound to one session sink. Each iteration samples host
// metrics, composes a line and appends it to the sink.
//
// Idle -> Running on start(), Running -> Idle on stop(). Starting a running
// monitor or stopping an idle one does nothing.
class SystemMonitor {
public:
    SystemMonitor(std::shared_ptr<LogSink>       sink,
                  std::shared_ptr<MetricsSampler> sampler,
                  std::atomic<bool>&              should_stop,
                  MonitorOptions                  options = {});
    ~SystemMonitor();

    SystemMonitor(SystemMonitor const&)            = delete;
    SystemMonitor& operator=(SystemMonitor const&) = delete;

    void start(std::chrono::milliseconds interval);

    // Best effort: waits up to stop_grace for the loop to exit. Returns true
    // when the monitor was running.
    auto stop() -> bool;

    [[nodiscard]] auto is_running() const -> bool;
    // Session whose sink this monitor writes to.
    [[nodiscard]] auto session_id() const -> std::string const&;
    [[nodiscard]] auto interval() const -> std::chrono::milliseconds;
    // Lines appended by the loop since construction, across restarts.
    [[nodiscard]] auto produced() const -> std::uint64_t;

    struct LoopState;

private:
    std::shared_ptr<LogSink>        sink_;
    std::shared_ptr<MetricsSampler> sampler_;
    std::atomic<bool>&              should_stop_;
    MonitorOptions                  options_;

    mutable std::mutex               mutex_;
    std::shared_ptr<LoopState>       loop_;
    std::chrono::milliseconds        interval_{0};
    std::shared_ptr<std::atomic<std::uint64_t>> produced_;
};

} // namespace LS::Monitor
