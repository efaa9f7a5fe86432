#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <logstream/core/Error.hpp>
#include <logstream/session/LogSink.hpp>

namespace httplib {
class Server;
class Request;
class Response;
struct DataSink;
} // namespace httplib

namespace LS::Web {

struct HttpRequestContext;

inline constexpr std::string_view kIdleTimeoutMessage = "Connection timed out due to inactivity.";

struct TailStreamOptions {
    std::chrono::milliseconds idle_timeout{std::chrono::seconds{300}};
    std::chrono::milliseconds poll_interval{100};
    std::size_t               max_batch = 64;
};

// "data: <json string>\n\n" for one log line.
auto encode_log_frame(std::string_view line) -> std::string;

// Live tail of one session log as a server-sent event stream. Driven by the
// HTTP worker through pump(); each call emits whatever complete lines are
// available, or waits one poll interval. The stream ends (sink.done()) on idle
// timeout, on the shutdown flag, on cancel(), or after a single error frame
// when the log cannot be read.
class LogTailStream {
public:
    LogTailStream(std::shared_ptr<LogSink> sink,
                  std::atomic<bool>&       should_stop,
                  TailStreamOptions        options = {});

    auto pump(httplib::DataSink& sink) -> bool;
    void cancel();
    void finalize(bool done);

    [[nodiscard]] auto finished() const -> bool { return finished_; }
    // Success unless the stream ended on a read fault.
    [[nodiscard]] auto status() const -> Expected<void>;
    [[nodiscard]] auto lines_sent() const -> std::size_t { return lines_sent_; }

private:
    auto open_reader(httplib::DataSink& sink) -> bool;
    void fail(httplib::DataSink& sink, Error error);
    void finish(httplib::DataSink& sink);

    std::shared_ptr<LogSink>              log_;
    std::atomic<bool>&                    should_stop_;
    TailStreamOptions                     options_;
    std::optional<LogReader>              reader_;
    std::optional<Error>                  failure_;
    std::chrono::steady_clock::time_point last_activity_{std::chrono::steady_clock::now()};
    std::size_t                           lines_sent_{0};
    bool                                  finished_{false};
    std::atomic<bool>                     cancelled_{false};
};

class LogStreamBroadcaster {
public:
    static auto Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
        -> std::unique_ptr<LogStreamBroadcaster>;

    void register_routes(httplib::Server& server);

    ~LogStreamBroadcaster();

    [[nodiscard]] auto active_streams() const -> std::size_t { return active_streams_.load(); }

private:
    LogStreamBroadcaster(HttpRequestContext& ctx, std::atomic<bool>& should_stop);

    void handle_logs_request(httplib::Request const& req, httplib::Response& res);

    HttpRequestContext&      ctx_;
    std::atomic<bool>&       should_stop_;
    std::atomic<std::size_t> active_streams_{0};
};

} // namespace LS::Web
