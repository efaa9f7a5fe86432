#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <logstream/web/LogStreamServer.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/runtime/ShutdownSignal.hpp>
#include <logstream/web/routing/HttpHelpers.hpp>
#include <logstream/web/routing/SessionController.hpp>
#include <logstream/web/streaming/LogStreamBroadcaster.hpp>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace LS::Web {

namespace {

constexpr auto kStopPollInterval = std::chrono::milliseconds(200);
constexpr auto kStartTimeout     = std::chrono::milliseconds(2000);

} // namespace

auto MakeRegistryOptions(LogStreamOptions const& options) -> RegistryOptions {
    RegistryOptions registry_options{};
    registry_options.logs_dir           = options.logs_dir;
    registry_options.monitor.stop_grace = std::chrono::milliseconds{options.monitor_stop_grace_ms};
    return registry_options;
}

int RunLogStreamServerWithStopFlag(SessionRegistry&                   registry,
                                   LogStreamOptions const&            options,
                                   std::atomic<bool>&                 should_stop,
                                   LogStreamLogHooks const&           log_hooks,
                                   std::function<void(Expected<int>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    auto report_listen_status = [&](Expected<int> status) {
        if (on_listen) {
            on_listen(std::move(status));
        }
    };

    HttpRequestContext http_context{registry, options};

    httplib::Server server;
    server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

    server.Get("/", [&](httplib::Request const&, httplib::Response& res) {
        write_json_response(res,
                            nlohmann::json{{"message", "Log streaming service"},
                                           {"sessions", "/api/sessions"}},
                            200);
    });

    server.Get("/healthz", [&](httplib::Request const&, httplib::Response& res) {
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Post("/shutdown", [&](httplib::Request const&, httplib::Response& res) {
        ls_log("Shutdown requested over HTTP", "LogStreamServer", "INFO");
        should_stop.store(true, std::memory_order_release);
        write_json_response(res, nlohmann::json{{"message", "Server shutting down"}}, 200, true);
    });

    auto session_controller = SessionController::Create(http_context);
    session_controller->register_routes(server);

    auto broadcaster = LogStreamBroadcaster::Create(http_context, should_stop);
    broadcaster->register_routes(server);

    int bound_port = options.port;
    if (options.port == 0) {
        bound_port = server.bind_to_any_port(options.host);
    } else if (!server.bind_to_port(options.host, options.port)) {
        bound_port = -1;
    }
    if (bound_port < 0) {
        log_error(std::string{"[logstream] Failed to bind "} + options.host + ":" + std::to_string(options.port));
        report_listen_status(std::unexpected(Error{Error::Code::ResourceFault, "failed to bind LogStream listener"}));
        registry.shutdown_all();
        return EXIT_FAILURE;
    }

    std::atomic<bool> listen_failed{false};
    std::thread       server_thread([&]() {
        if (!server.listen_after_bind()) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                log_error(std::string{"[logstream] Listener on port "} + std::to_string(bound_port) + " failed");
            }
        }
    });

    log_info(std::string{"[logstream] Listening on http://"} + options.host + ":" + std::to_string(bound_port));
    ls_log("Logs directory: " + registry.logs_dir().string(), "LogStreamServer", "INFO");

    bool listen_reported = false;
    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported && server.is_running()) {
            report_listen_status(bound_port);
            listen_reported = true;
        }
        std::this_thread::sleep_for(listen_reported ? kStopPollInterval : std::chrono::milliseconds(10));
    }

    if (!listen_reported) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(Error{Error::Code::ResourceFault, "LogStream listener failed"}));
        } else {
            report_listen_status(std::unexpected(Error{Error::Code::InvalidError, "LogStream stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    auto report = registry.shutdown_all();
    log_info(std::string{"[logstream] Shutdown: stopped "} + std::to_string(report.monitors_stopped)
             + " monitors, cleared " + std::to_string(report.sessions_cleared) + " sessions, deleted "
             + std::to_string(report.logs_deleted) + " log files");

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunLogStreamServer(LogStreamOptions const& options) {
    auto&           should_stop = Runtime::shutdown_flag();
    SessionRegistry registry{MakeRegistryOptions(options), should_stop};
    return RunLogStreamServerWithStopFlag(registry, options, should_stop, {}, {});
}

LogStreamServer::LogStreamServer(SessionRegistry& registry, std::atomic<bool>& should_stop)
    : registry_(registry)
    , should_stop_(should_stop) {}

LogStreamServer::~LogStreamServer() {
    stop();
}

auto LogStreamServer::start(LogStreamOptions options) -> Expected<int> {
    if (server_thread_.joinable()) {
        return std::unexpected(Error{Error::Code::InvalidError, "LogStreamServer already started"});
    }
    if (auto invalid = ValidateLogStreamOptions(options)) {
        return std::unexpected(Error{Error::Code::MalformedInput, *invalid});
    }

    // A private flag is rearmed on every start. The process-wide flag is never
    // lowered once a shutdown has been requested.
    if (&should_stop_ == &Runtime::shutdown_flag()) {
        if (Runtime::ShutdownRequested()) {
            return std::unexpected(Error{Error::Code::InvalidError, "process shutdown already requested"});
        }
    } else {
        should_stop_.store(false, std::memory_order_release);
    }
    running_.store(true, std::memory_order_release);

    auto ready_promise  = std::make_shared<std::promise<Expected<int>>>();
    auto ready_future   = ready_promise->get_future();
    auto ready_reported = std::make_shared<std::atomic<bool>>(false);

    server_thread_ = std::thread([this, options, ready_promise, ready_reported]() {
        auto on_listen = [ready_promise, ready_reported](Expected<int> status) {
            bool expected = false;
            if (!ready_reported->compare_exchange_strong(expected, true)) {
                return;
            }
            ready_promise->set_value(std::move(status));
        };
        LogStreamLogHooks hooks{
            .info  = [](std::string_view message) { ls_log(std::string{message}, "LogStreamServer", "INFO"); },
            .error = [](std::string_view message) { ls_log(std::string{message}, "LogStreamServer", "ERROR"); },
        };
        RunLogStreamServerWithStopFlag(registry_, options, should_stop_, hooks, on_listen);
        on_listen(std::unexpected(Error{Error::Code::InvalidError, "LogStream server exited"}));
        running_.store(false, std::memory_order_release);
    });

    if (ready_future.wait_for(kStartTimeout) != std::future_status::ready) {
        stop();
        return std::unexpected(Error{Error::Code::Timeout, "LogStream server did not start in time"});
    }
    auto status = ready_future.get();
    if (!status) {
        stop();
        return std::unexpected(status.error());
    }
    port_ = *status;
    return port_;
}

void LogStreamServer::stop() {
    if (!server_thread_.joinable()) {
        running_.store(false, std::memory_order_release);
        return;
    }
    should_stop_.store(true, std::memory_order_release);
    server_thread_.join();
    running_.store(false, std::memory_order_release);
}

} // namespace LS::Web
