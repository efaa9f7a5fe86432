#include <doctest/doctest.h>

#include "unit/LogStreamTestHelper.hpp"

#include <logstream/session/SessionRegistry.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace LS;
using namespace std::chrono_literals;
using LS::Testing::FixedSampler;
using LS::Testing::TempDir;
using LS::Testing::count_containing;
using LS::Testing::read_lines;
using LS::Testing::wait_until;

namespace {

auto make_options(TempDir const& dir, std::shared_ptr<FixedSampler> sampler) -> RegistryOptions {
    RegistryOptions options{};
    options.logs_dir       = dir.path();
    options.sampler        = std::move(sampler);
    options.monitor.jitter = 0ms;
    return options;
}

auto now() {
    return std::chrono::system_clock::now();
}

} // namespace

TEST_SUITE("session.registry") {
TEST_CASE("register and unregister keep the session count consistent") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    REQUIRE(registry.register_session("a", SessionMetadata{now(), now(), false}));
    REQUIRE(registry.register_session("b", SessionMetadata{now(), now(), false}));
    CHECK(registry.session_count() == 2);
    CHECK(dir.count_logs() == 2);

    CHECK(registry.unregister_session("a"));
    CHECK(registry.session_count() == 1);
    CHECK_FALSE(registry.contains("a"));
    CHECK(dir.count_logs() == 1);

    SUBCASE("unregistering an absent id is a no-op") {
        CHECK_FALSE(registry.unregister_session("a"));
        CHECK_FALSE(registry.unregister_session("never"));
        CHECK(registry.session_count() == 1);
    }
}

TEST_CASE("duplicate and malformed ids are rejected") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    REQUIRE(registry.register_session("dup", SessionMetadata{now(), now(), false}));
    auto again = registry.register_session("dup", SessionMetadata{now(), now(), false});
    REQUIRE_FALSE(again);
    CHECK(again.error().code == Error::Code::DuplicateSession);

    auto traversal = registry.register_session("../escape", SessionMetadata{now(), now(), false});
    REQUIRE_FALSE(traversal);
    CHECK(traversal.error().code == Error::Code::MalformedInput);
    CHECK(registry.session_count() == 1);
}

TEST_CASE("create_session registers a fresh id and records creation") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    auto id = registry.create_session();
    REQUIRE(id);
    CHECK(registry.contains(*id));
    CHECK_FALSE(registry.is_monitoring(*id));

    auto sink = registry.sink_for(*id);
    REQUIRE(sink);
    auto lines = read_lines((*sink)->path());
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("Session created with ID: " + *id) != std::string::npos);
}

TEST_CASE("monitoring flag follows the attached monitor") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    auto              sampler = std::make_shared<FixedSampler>();
    SessionRegistry   registry{make_options(dir, sampler), stop};

    auto id = registry.create_session();
    REQUIRE(id);
    REQUIRE(registry.start_monitoring(*id, 50ms));
    CHECK(registry.is_monitoring(*id));
    CHECK(registry.monitor_count() == 1);

    auto snapshot = registry.snapshot_sessions();
    REQUIRE(snapshot.size() == 1);
    CHECK(snapshot[0].metadata.monitoring);

    CHECK(registry.stop_monitor(*id));
    CHECK_FALSE(registry.is_monitoring(*id));
    CHECK(registry.monitor_count() == 0);
    CHECK_FALSE(registry.snapshot_sessions()[0].metadata.monitoring);

    SUBCASE("stopping again reports nothing to stop and writes nothing") {
        auto sink   = registry.sink_for(*id);
        REQUIRE(sink);
        auto before = read_lines((*sink)->path()).size();
        CHECK_FALSE(registry.stop_monitor(*id));
        CHECK(read_lines((*sink)->path()).size() == before);
    }
}

TEST_CASE("restarting monitoring replaces the old monitor") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    auto id = registry.create_session();
    REQUIRE(id);
    REQUIRE(registry.start_monitoring(*id, 1s));
    REQUIRE(registry.start_monitoring(*id, 1s));
    CHECK(registry.monitor_count() == 1);

    auto sink = registry.sink_for(*id);
    REQUIRE(sink);
    auto lines = read_lines((*sink)->path());
    CHECK(count_containing(lines, "Started system monitoring") == 2);
    CHECK(count_containing(lines, "Stopped system monitoring") == 1);
}

TEST_CASE("attach_monitor requires an existing session") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    auto              sampler = std::make_shared<FixedSampler>();
    SessionRegistry   registry{make_options(dir, sampler), stop};

    auto orphan_sink = std::make_shared<LogSink>("orphan", dir.path() / "orphan.log");
    REQUIRE(orphan_sink->open());
    auto monitor = std::make_unique<Monitor::SystemMonitor>(orphan_sink, sampler, stop);
    monitor->start(1s);

    auto attached = registry.attach_monitor("orphan", std::move(monitor));
    REQUIRE_FALSE(attached);
    CHECK(attached.error().code == Error::Code::NotFound);
    CHECK(registry.monitor_count() == 0);

    auto id = registry.create_session();
    REQUIRE(id);
    auto sink = registry.sink_for(*id);
    REQUIRE(sink);
    auto own = std::make_unique<Monitor::SystemMonitor>(*sink, sampler, stop);
    own->start(1s);
    REQUIRE(registry.attach_monitor(*id, std::move(own)));
    CHECK(registry.is_monitoring(*id));
}

TEST_CASE("attach_monitor rejects a monitor that is not running") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    auto              sampler = std::make_shared<FixedSampler>();
    SessionRegistry   registry{make_options(dir, sampler), stop};

    auto id = registry.create_session();
    REQUIRE(id);
    auto sink = registry.sink_for(*id);
    REQUIRE(sink);

    auto idle     = std::make_unique<Monitor::SystemMonitor>(*sink, sampler, stop);
    auto attached = registry.attach_monitor(*id, std::move(idle));
    REQUIRE_FALSE(attached);
    CHECK(attached.error().code == Error::Code::MalformedInput);
    CHECK_FALSE(registry.is_monitoring(*id));
    CHECK_FALSE(registry.snapshot_sessions()[0].metadata.monitoring);
    CHECK(registry.monitor_count() == 0);
    CHECK_FALSE(registry.stop_monitor(*id));

    auto null_monitor = registry.attach_monitor(*id, nullptr);
    REQUIRE_FALSE(null_monitor);
    CHECK(null_monitor.error().code == Error::Code::MalformedInput);
}

TEST_CASE("attach_monitor rejects a monitor bound to another session") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    auto              sampler = std::make_shared<FixedSampler>();
    SessionRegistry   registry{make_options(dir, sampler), stop};

    auto first  = registry.create_session();
    auto second = registry.create_session();
    REQUIRE(first);
    REQUIRE(second);
    auto second_sink = registry.sink_for(*second);
    REQUIRE(second_sink);

    auto foreign = std::make_unique<Monitor::SystemMonitor>(*second_sink, sampler, stop);
    foreign->start(20ms);
    auto attached = registry.attach_monitor(*first, std::move(foreign));
    REQUIRE_FALSE(attached);
    CHECK(attached.error().code == Error::Code::MalformedInput);
    CHECK_FALSE(registry.is_monitoring(*first));
    CHECK_FALSE(registry.is_monitoring(*second));
    CHECK(registry.monitor_count() == 0);

    // The rejected monitor was stopped, so the other session's log stays quiet.
    auto const settled = read_lines((*second_sink)->path());
    CHECK(count_containing(settled, "Stopped system monitoring") == 1);
    std::this_thread::sleep_for(100ms);
    CHECK(read_lines((*second_sink)->path()).size() == settled.size());
}

TEST_CASE("unknown ids are reported by operations that need a session") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    auto appended = registry.append_log("ghost", LogLevel::Info, "hello");
    REQUIRE_FALSE(appended);
    CHECK(appended.error().code == Error::Code::NotFound);

    auto sink = registry.sink_for("ghost");
    REQUIRE_FALSE(sink);
    CHECK(sink.error().code == Error::Code::NotFound);

    auto started = registry.start_monitoring("ghost", 1s);
    REQUIRE_FALSE(started);
    CHECK(started.error().code == Error::Code::NotFound);

    CHECK_FALSE(registry.touch("ghost"));
    CHECK_FALSE(registry.stop_monitor("ghost"));
}

TEST_CASE("append_log writes with the requested level and touches the session") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    auto id = registry.create_session();
    REQUIRE(id);
    auto before = registry.snapshot_sessions()[0].metadata.last_activity;
    std::this_thread::sleep_for(5ms);
    REQUIRE(registry.append_log(*id, LogLevel::Error, "manual entry"));
    CHECK(registry.snapshot_sessions()[0].metadata.last_activity > before);

    auto sink = registry.sink_for(*id);
    REQUIRE(sink);
    auto lines = read_lines((*sink)->path());
    CHECK(count_containing(lines, "ERROR - manual entry") == 1);
}

TEST_CASE("shutdown_all clears everything") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    SUBCASE("empty registry") {
        auto report = registry.shutdown_all();
        CHECK(report.monitors_stopped == 0);
        CHECK(report.sessions_cleared == 0);
        CHECK(report.logs_deleted == 0);
    }

    SUBCASE("one session with a monitor") {
        auto id = registry.create_session();
        REQUIRE(id);
        REQUIRE(registry.start_monitoring(*id, 50ms));
        auto report = registry.shutdown_all();
        CHECK(report.monitors_stopped == 1);
        CHECK(report.sessions_cleared == 1);
        CHECK(report.logs_deleted == 1);
    }

    SUBCASE("many sessions") {
        for (int i = 0; i < 8; ++i) {
            auto id = registry.create_session();
            REQUIRE(id);
            if (i % 2 == 0) {
                REQUIRE(registry.start_monitoring(*id, 50ms));
            }
        }
        auto report = registry.shutdown_all();
        CHECK(report.monitors_stopped == 4);
        CHECK(report.sessions_cleared == 8);
        CHECK(report.logs_deleted == 8);
    }

    SUBCASE("a thousand sessions") {
        REQUIRE(LS::Testing::ensure_open_file_limit(4096));
        for (int i = 0; i < 1000; ++i) {
            auto id = registry.create_session();
            REQUIRE(id);
            if (i % 10 == 0) {
                REQUIRE(registry.start_monitoring(*id, 50ms));
            }
        }
        CHECK(registry.session_count() == 1000);
        CHECK(registry.monitor_count() == 100);
        CHECK(dir.count_logs() == 1000);

        auto report = registry.shutdown_all();
        CHECK(report.monitors_stopped == 100);
        CHECK(report.sessions_cleared == 1000);
        CHECK(report.logs_deleted == 1000);
    }

    CHECK(registry.session_count() == 0);
    CHECK(registry.monitor_count() == 0);
    CHECK(dir.count_logs() == 0);
}

TEST_CASE("concurrent create and delete leave a consistent registry") {
    TempDir           dir;
    std::atomic<bool> stop{false};
    SessionRegistry   registry{make_options(dir, std::make_shared<FixedSampler>()), stop};

    constexpr int            kThreads = 4;
    constexpr int            kRounds  = 25;
    std::vector<std::thread> workers;
    std::atomic<int>         kept{0};
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kRounds; ++i) {
                auto id = registry.create_session();
                if (!id) {
                    continue;
                }
                if ((i + t) % 3 == 0) {
                    auto started = registry.start_monitoring(*id, 20ms);
                    (void)started;
                }
                if (i % 2 == 0) {
                    registry.unregister_session(*id);
                } else {
                    kept.fetch_add(1);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(registry.session_count() == static_cast<std::size_t>(kept.load()));
    for (auto const& snapshot : registry.snapshot_sessions()) {
        CHECK(snapshot.metadata.monitoring == registry.is_monitoring(snapshot.id));
    }
    registry.shutdown_all();
    CHECK(dir.count_logs() == 0);
}
}
