#include <logstream/session/SessionRegistry.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/monitor/ProcMetricsSampler.hpp>
#include <logstream/session/SessionId.hpp>

#include <algorithm>
#include <utility>

namespace LS {

SessionRegistry::SessionRegistry(RegistryOptions options, std::atomic<bool>& should_stop)
    : options_{std::move(options)}
    , should_stop_{should_stop}
    , sinks_{options_.logs_dir} {
    if (!options_.sampler) {
        options_.sampler = std::make_shared<Monitor::ProcMetricsSampler>();
    }
}

SessionRegistry::~SessionRegistry() {
    std::lock_guard const lock{mutex_};
    for (auto& [id, monitor] : monitors_) {
        monitor->stop();
    }
    monitors_.clear();
}

auto SessionRegistry::create_session() -> Expected<std::string> {
    auto const now = std::chrono::system_clock::now();
    auto       id  = generate_session_id();
    if (auto registered = register_session(id, SessionMetadata{now, now, false}); !registered) {
        return std::unexpected(registered.error());
    }
    if (auto written = append_log(id, LogLevel::Info, "Session created with ID: " + id); !written) {
        ls_log("Unable to record session creation: " + describeError(written.error()), "SessionRegistry", "ERROR");
    }
    return id;
}

auto SessionRegistry::register_session(std::string const& id, SessionMetadata metadata) -> Expected<void> {
    if (!is_valid_session_id(id)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid session id '" + id + "'"});
    }
    std::lock_guard const lock{mutex_};
    if (sessions_.contains(id)) {
        return std::unexpected(Error{Error::Code::DuplicateSession, "session " + id + " already registered"});
    }
    auto sink = sinks_.acquire(id, true);
    if (!sink) {
        return std::unexpected(sink.error());
    }
    metadata.monitoring = false;
    sessions_.emplace(id, metadata);
    ls_log("Registered session " + id, "SessionRegistry", "INFO");
    return {};
}

auto SessionRegistry::unregister_session(std::string const& id) -> bool {
    std::lock_guard const lock{mutex_};
    stop_monitor_locked(id);
    auto const removed = sessions_.erase(id) > 0;
    sinks_.release(id);
    if (removed) {
        ls_log("Unregistered session " + id, "SessionRegistry", "INFO");
    }
    return removed;
}

auto SessionRegistry::attach_monitor(std::string const& id, std::unique_ptr<Monitor::SystemMonitor> monitor)
        -> Expected<void> {
    std::lock_guard const lock{mutex_};
    auto                  it = sessions_.find(id);
    if (it == sessions_.end()) {
        if (monitor) {
            monitor->stop();
        }
        return std::unexpected(Error{Error::Code::NotFound, "session " + id + " not found"});
    }
    if (!monitor) {
        return std::unexpected(Error{Error::Code::MalformedInput, "no monitor supplied"});
    }
    // The monitoring flag must only ever reflect a live loop writing to this
    // session's own sink.
    if (monitor->session_id() != id) {
        monitor->stop();
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "monitor writes to session " + monitor->session_id() + ", not " + id});
    }
    if (!monitor->is_running()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "monitor for session " + id + " is not running"});
    }
    stop_monitor_locked(id);
    monitors_.insert_or_assign(id, std::move(monitor));
    it->second.monitoring    = true;
    it->second.last_activity = std::chrono::system_clock::now();
    return {};
}

auto SessionRegistry::start_monitoring(std::string const& id, std::chrono::milliseconds interval) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    auto                  it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "session " + id + " not found"});
    }
    auto sink = sinks_.find(id);
    if (!sink) {
        return std::unexpected(Error{Error::Code::ResourceFault, "session " + id + " has no log sink"});
    }
    stop_monitor_locked(id);
    auto monitor = std::make_unique<Monitor::SystemMonitor>(sink, options_.sampler, should_stop_, options_.monitor);
    monitor->start(interval);
    monitors_.insert_or_assign(id, std::move(monitor));
    it->second.monitoring    = true;
    it->second.last_activity = std::chrono::system_clock::now();
    return {};
}

auto SessionRegistry::stop_monitor(std::string const& id) -> bool {
    std::lock_guard const lock{mutex_};
    return stop_monitor_locked(id);
}

auto SessionRegistry::stop_monitor_locked(std::string const& id) -> bool {
    auto it = monitors_.find(id);
    if (it == monitors_.end()) {
        return false;
    }
    auto monitor = std::move(it->second);
    monitors_.erase(it);
    if (auto session = sessions_.find(id); session != sessions_.end()) {
        session->second.monitoring = false;
    }
    return monitor->stop();
}

auto SessionRegistry::shutdown_all() -> ShutdownReport {
    std::lock_guard const lock{mutex_};
    ShutdownReport        report{};
    for (auto& [id, monitor] : monitors_) {
        monitor->stop();
        ++report.monitors_stopped;
    }
    monitors_.clear();
    report.sessions_cleared = sessions_.size();
    sessions_.clear();
    report.logs_deleted = sinks_.release_all();
    ls_log("Shutdown complete: stopped " + std::to_string(report.monitors_stopped) + " monitors, cleared "
               + std::to_string(report.sessions_cleared) + " sessions, deleted " + std::to_string(report.logs_deleted)
               + " log files",
           "SessionRegistry", "INFO");
    return report;
}

auto SessionRegistry::snapshot_sessions() const -> std::vector<SessionSnapshot> {
    std::vector<SessionSnapshot> snapshot;
    {
        std::lock_guard const lock{mutex_};
        snapshot.reserve(sessions_.size());
        for (auto const& [id, metadata] : sessions_) {
            snapshot.push_back(SessionSnapshot{id, metadata});
        }
    }
    std::ranges::sort(snapshot, [](SessionSnapshot const& lhs, SessionSnapshot const& rhs) {
        if (lhs.metadata.created_at != rhs.metadata.created_at) {
            return lhs.metadata.created_at < rhs.metadata.created_at;
        }
        return lhs.id < rhs.id;
    });
    return snapshot;
}

auto SessionRegistry::touch(std::string const& id) -> bool {
    std::lock_guard const lock{mutex_};
    auto                  it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.last_activity = std::chrono::system_clock::now();
    return true;
}

auto SessionRegistry::append_log(std::string const& id, LogLevel level, std::string_view message) -> Expected<void> {
    std::shared_ptr<LogSink> sink;
    {
        std::lock_guard const lock{mutex_};
        auto                  it = sessions_.find(id);
        if (it == sessions_.end()) {
            return std::unexpected(Error{Error::Code::NotFound, "session " + id + " not found"});
        }
        sink = sinks_.find(id);
        if (!sink) {
            return std::unexpected(Error{Error::Code::ResourceFault, "session " + id + " has no log sink"});
        }
        it->second.last_activity = std::chrono::system_clock::now();
    }
    return sink->append(level, message);
}

auto SessionRegistry::sink_for(std::string const& id) const -> Expected<std::shared_ptr<LogSink>> {
    std::lock_guard const lock{mutex_};
    if (!sessions_.contains(id)) {
        return std::unexpected(Error{Error::Code::NotFound, "session " + id + " not found"});
    }
    auto sink = sinks_.find(id);
    if (!sink) {
        return std::unexpected(Error{Error::Code::NotFound, "no log sink for session " + id});
    }
    return sink;
}

auto SessionRegistry::contains(std::string const& id) const -> bool {
    std::lock_guard const lock{mutex_};
    return sessions_.contains(id);
}

auto SessionRegistry::is_monitoring(std::string const& id) const -> bool {
    std::lock_guard const lock{mutex_};
    return monitors_.contains(id);
}

auto SessionRegistry::session_count() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return sessions_.size();
}

auto SessionRegistry::monitor_count() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return monitors_.size();
}

} // namespace LS
