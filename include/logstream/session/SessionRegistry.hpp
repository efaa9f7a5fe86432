#pragma once

#include <logstream/core/Error.hpp>
#include <logstream/monitor/SystemMonitor.hpp>
#include <logstream/session/LogLevel.hpp>
#include <logstream/session/LogSinkStore.hpp>

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace LS {

struct SessionMetadata {
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_activity;
    bool                                  monitoring = false;
};

struct SessionSnapshot {
    std::string     id;
    SessionMetadata metadata;
};

struct ShutdownReport {
    std::size_t monitors_stopped = 0;
    std::size_t sessions_cleared = 0;
    std::size_t logs_deleted     = 0;
};

struct RegistryOptions {
    std::filesystem::path                    logs_dir = "logs";
    Monitor::MonitorOptions                  monitor;
    std::shared_ptr<Monitor::MetricsSampler> sampler;
};

// Owns every session record, every attached monitor and the sink store. All
// operations run under one lock; compound operations (unregister,
// shutdown_all) are a single critical section, so no caller ever observes a
// session whose monitor state disagrees with its record.
class SessionRegistry {
public:
    SessionRegistry(RegistryOptions options, std::atomic<bool>& should_stop);
    ~SessionRegistry();

    SessionRegistry(SessionRegistry const&)            = delete;
    SessionRegistry& operator=(SessionRegistry const&) = delete;

    // Fresh id, new cleared sink and a "Session created" line.
    auto create_session() -> Expected<std::string>;

    auto register_session(std::string const& id, SessionMetadata metadata) -> Expected<void>;

    // Stops the monitor, drops the record and deletes the session log.
    // Unknown ids are ignored; the result tells whether a record existed.
    auto unregister_session(std::string const& id) -> bool;

    // Takes ownership of a running monitor bound to this session's sink,
    // replacing any monitor already attached. Anything else is MalformedInput.
    auto attach_monitor(std::string const& id, std::unique_ptr<Monitor::SystemMonitor> monitor) -> Expected<void>;

    auto start_monitoring(std::string const& id, std::chrono::milliseconds interval) -> Expected<void>;

    auto stop_monitor(std::string const& id) -> bool;

    auto shutdown_all() -> ShutdownReport;

    [[nodiscard]] auto snapshot_sessions() const -> std::vector<SessionSnapshot>;

    auto touch(std::string const& id) -> bool;

    auto append_log(std::string const& id, LogLevel level, std::string_view message) -> Expected<void>;

    [[nodiscard]] auto sink_for(std::string const& id) const -> Expected<std::shared_ptr<LogSink>>;

    [[nodiscard]] auto contains(std::string const& id) const -> bool;
    [[nodiscard]] auto is_monitoring(std::string const& id) const -> bool;
    [[nodiscard]] auto session_count() const -> std::size_t;
    [[nodiscard]] auto monitor_count() const -> std::size_t;
    [[nodiscard]] auto logs_dir() const -> std::filesystem::path const& { return sinks_.logs_dir(); }

private:
    auto stop_monitor_locked(std::string const& id) -> bool;

    RegistryOptions    options_;
    std::atomic<bool>& should_stop_;

    mutable std::mutex                                                            mutex_;
    phmap::flat_hash_map<std::string, SessionMetadata>                            sessions_;
    phmap::flat_hash_map<std::string, std::unique_ptr<Monitor::SystemMonitor>>    monitors_;
    LogSinkStore                                                                  sinks_;
};

} // namespace LS
