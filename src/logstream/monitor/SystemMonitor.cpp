#include <logstream/monitor/SystemMonitor.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/monitor/MessageClassifier.hpp>

#include <algorithm>
#include <condition_variable>
#include <random>
#include <string>
#include <thread>
#include <utility>

namespace LS::Monitor {

// Everything the loop thread touches. Shared with the thread so a detached
// loop stays valid after its SystemMonitor is gone.
struct SystemMonitor::LoopState {
    std::mutex                                   mutex;
    std::condition_variable                      cv;
    bool                                         running = true;
    bool                                         exited  = false;
    std::thread                                  thread;
    std::shared_ptr<LogSink>                     sink;
    std::shared_ptr<MetricsSampler>              sampler;
    std::shared_ptr<std::atomic<std::uint64_t>>  produced;
    std::atomic<bool>*                           should_stop = nullptr;
    std::chrono::milliseconds                    interval{0};
    std::chrono::milliseconds                    jitter{0};
    std::mt19937                                 rng;

    auto keep_running() -> bool {
        std::lock_guard const lock{mutex};
        return running && !should_stop->load();
    }

    // Sleeps until the deadline, stop() or the global shutdown flag.
    void sleep_for(std::chrono::milliseconds duration) {
        auto const deadline = std::chrono::steady_clock::now() + duration;
        std::unique_lock lock{mutex};
        // The global flag has no notifier, so wake periodically to observe it.
        while (running && !should_stop->load()) {
            auto const now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return;
            }
            cv.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds{100}));
        }
    }

    auto jittered_interval() -> std::chrono::milliseconds {
        if (jitter.count() <= 0) {
            return interval;
        }
        std::uniform_int_distribution<long long> dist{-jitter.count(), jitter.count()};
        auto const                               value = interval.count() + dist(rng);
        return std::chrono::milliseconds{std::max<long long>(0, value)};
    }

    void run() {
        set_thread_name("Monitor " + sink->session_id());
        while (keep_running()) {
            auto sample = sampler->sample();
            if (!sample) {
                ls_log("Error in monitoring thread: " + describeError(sample.error()), "SystemMonitor", "ERROR");
                sleep_for(interval);
                continue;
            }
            auto message = compose_message(*sample, rng);
            auto failed  = false;
            {
                // Re-checked under the state lock so no line lands after stop()
                // has observed the exit.
                std::lock_guard const lock{mutex};
                if (!running) {
                    break;
                }
                if (auto appended = sink->append(message.level, message.text); !appended) {
                    ls_log("Error in monitoring thread: " + describeError(appended.error()), "SystemMonitor", "ERROR");
                    failed = true;
                } else {
                    produced->fetch_add(1);
                }
            }
            sleep_for(failed ? interval : jittered_interval());
        }
        std::lock_guard const lock{mutex};
        exited = true;
        cv.notify_all();
    }
};

SystemMonitor::SystemMonitor(std::shared_ptr<LogSink>       sink,
                             std::shared_ptr<MetricsSampler> sampler,
                             std::atomic<bool>&              should_stop,
                             MonitorOptions                  options)
    : sink_{std::move(sink)}
    , sampler_{std::move(sampler)}
    , should_stop_{should_stop}
    , options_{options}
    , produced_{std::make_shared<std::atomic<std::uint64_t>>(0)} {}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start(std::chrono::milliseconds interval) {
    std::lock_guard const lock{mutex_};
    if (loop_) {
        return;
    }

    auto state         = std::make_shared<LoopState>();
    state->sink        = sink_;
    state->sampler     = sampler_;
    state->produced    = produced_;
    state->should_stop = &should_stop_;
    state->interval    = std::max(interval, std::chrono::milliseconds{0});
    state->jitter      = options_.jitter;
    state->rng.seed(options_.seed != 0 ? options_.seed : std::random_device{}());

    interval_ = state->interval;

    auto text = std::to_string(std::chrono::duration<double>(interval_).count());
    if (interval_.count() % 1000 == 0) {
        text = std::to_string(interval_.count() / 1000);
    } else {
        text.erase(text.find_last_not_of('0') + 1);
    }
    if (auto written = sink_->append(LogLevel::Info, "Started system monitoring with interval: " + text + "s"); !written) {
        ls_log("Unable to record monitor start: " + describeError(written.error()), "SystemMonitor", "ERROR");
    }

    state->thread = std::thread([state] { state->run(); });
    loop_         = std::move(state);
}

auto SystemMonitor::stop() -> bool {
    std::lock_guard const lock{mutex_};
    if (!loop_) {
        return false;
    }
    auto state = std::move(loop_);
    loop_.reset();

    bool exited = false;
    {
        std::unique_lock state_lock{state->mutex};
        state->running = false;
        state->cv.notify_all();
        exited = state->cv.wait_for(state_lock, options_.stop_grace, [&] { return state->exited; });
    }
    if (state->thread.joinable()) {
        if (exited) {
            state->thread.join();
        } else {
            ls_log("Monitor for session " + sink_->session_id() + " did not exit within the grace period", "SystemMonitor", "WARNING");
            state->thread.detach();
        }
    }

    if (auto written = sink_->append(LogLevel::Info, "Stopped system monitoring"); !written) {
        ls_log("Unable to record monitor stop: " + describeError(written.error()), "SystemMonitor", "INFO");
    }
    return true;
}

auto SystemMonitor::is_running() const -> bool {
    std::lock_guard const lock{mutex_};
    return static_cast<bool>(loop_);
}

auto SystemMonitor::session_id() const -> std::string const& {
    return sink_->session_id();
}

auto SystemMonitor::interval() const -> std::chrono::milliseconds {
    std::lock_guard const lock{mutex_};
    return interval_;
}

auto SystemMonitor::produced() const -> std::uint64_t {
    return produced_->load();
}

} // namespace LS::Monitor
