#pragma once

#include <logstream/core/Error.hpp>
#include <logstream/session/SessionRegistry.hpp>
#include <logstream/web/LogStreamOptions.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>
#include <thread>

namespace LS::Web {

struct LogStreamLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

// Builds a registry from options and serves until the process shutdown flag
// is raised. Runs shutdown_all() before returning.
int RunLogStreamServer(LogStreamOptions const& options);

// on_listen receives the bound port once the listener is up, or the reason it
// never came up.
int RunLogStreamServerWithStopFlag(SessionRegistry&                        registry,
                                   LogStreamOptions const&                 options,
                                   std::atomic<bool>&                      should_stop,
                                   LogStreamLogHooks const&                log_hooks = {},
                                   std::function<void(Expected<int>)>      on_listen = {});

auto MakeRegistryOptions(LogStreamOptions const& options) -> RegistryOptions;

// Runs the server on a background thread; used by embedders and tests.
class LogStreamServer {
public:
    LogStreamServer(SessionRegistry& registry, std::atomic<bool>& should_stop);
    ~LogStreamServer();

    LogStreamServer(LogStreamServer const&)            = delete;
    LogStreamServer& operator=(LogStreamServer const&) = delete;

    // Returns the bound port. A private stop flag is cleared first so the
    // server can be restarted; Runtime::shutdown_flag() is never cleared, and
    // starting fails once a process shutdown has been requested.
    auto start(LogStreamOptions options) -> Expected<int>;
    void stop();

    [[nodiscard]] auto is_running() const -> bool { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] auto port() const -> int { return port_; }

private:
    SessionRegistry&   registry_;
    std::atomic<bool>& should_stop_;
    std::thread        server_thread_;
    std::atomic<bool>  running_{false};
    int                port_{0};
};

} // namespace LS::Web
