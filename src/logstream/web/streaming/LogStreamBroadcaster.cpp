#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <logstream/web/streaming/LogStreamBroadcaster.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/session/SessionId.hpp>
#include <logstream/session/SessionRegistry.hpp>
#include <logstream/web/LogStreamOptions.hpp>
#include <logstream/web/routing/HttpHelpers.hpp>

#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

namespace LS::Web {

namespace {

using json = nlohmann::json;

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

auto write_frame(httplib::DataSink& sink, std::string_view line) -> bool {
    auto block = encode_log_frame(line);
    return sink.write(block.data(), block.size());
}

} // namespace

auto encode_log_frame(std::string_view line) -> std::string {
    auto payload = json(std::string{line}).dump(-1, ' ', false, json::error_handler_t::replace);
    std::string block;
    block.reserve(payload.size() + 8);
    block.append("data: ");
    block.append(payload);
    block.append("\n\n");
    return block;
}

LogTailStream::LogTailStream(std::shared_ptr<LogSink> sink,
                             std::atomic<bool>&       should_stop,
                             TailStreamOptions        options)
    : log_(std::move(sink))
    , should_stop_(should_stop)
    , options_(options) {}

auto LogTailStream::pump(httplib::DataSink& sink) -> bool {
    if (finished_) {
        return false;
    }
    if (cancelled_.load(std::memory_order_acquire) || should_stop_.load(std::memory_order_acquire)) {
        finish(sink);
        return true;
    }

    if (!reader_ && !open_reader(sink)) {
        return true;
    }

    std::size_t emitted = 0;
    while (emitted < options_.max_batch) {
        auto line = reader_->next_line();
        if (!line) {
            fail(sink, Error{Error::Code::ResourceFault, "Error reading log file: " + describeError(line.error())});
            return true;
        }
        if (!line->has_value()) {
            break;
        }
        if (!write_frame(sink, trim(**line))) {
            return false;
        }
        ++emitted;
        ++lines_sent_;
    }

    auto const now = std::chrono::steady_clock::now();
    if (emitted > 0) {
        last_activity_ = now;
        return true;
    }

    if (now - last_activity_ > options_.idle_timeout) {
        write_frame(sink, kIdleTimeoutMessage);
        finish(sink);
        return true;
    }

    std::this_thread::sleep_for(options_.poll_interval);
    return true;
}

auto LogTailStream::open_reader(httplib::DataSink& sink) -> bool {
    if (!log_) {
        fail(sink, Error{Error::Code::NotFound, "Log file not found"});
        return false;
    }
    auto reader = log_->open_reader();
    if (!reader) {
        auto const& error = reader.error();
        if (error.code == Error::Code::NotFound) {
            fail(sink, Error{Error::Code::NotFound, "Log file not found: " + log_->path().string()});
        } else {
            fail(sink, Error{Error::Code::ResourceFault, "Error reading log file: " + describeError(error)});
        }
        return false;
    }
    reader_.emplace(std::move(*reader));
    last_activity_ = std::chrono::steady_clock::now();
    return true;
}

void LogTailStream::fail(httplib::DataSink& sink, Error error) {
    ls_log(describeError(error), "LogTailStream", "ERROR");
    write_frame(sink, error.message.value_or(std::string{errorCodeToString(error.code)}));
    failure_ = std::move(error);
    finish(sink);
}

void LogTailStream::finish(httplib::DataSink& sink) {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (sink.done) {
        sink.done();
    }
}

void LogTailStream::cancel() {
    cancelled_.store(true, std::memory_order_release);
}

void LogTailStream::finalize(bool) {
    cancelled_.store(true, std::memory_order_release);
}

auto LogTailStream::status() const -> Expected<void> {
    if (failure_) {
        return std::unexpected(*failure_);
    }
    return {};
}

auto LogStreamBroadcaster::Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    -> std::unique_ptr<LogStreamBroadcaster> {
    return std::unique_ptr<LogStreamBroadcaster>(new LogStreamBroadcaster(ctx, should_stop));
}

LogStreamBroadcaster::LogStreamBroadcaster(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    : ctx_(ctx)
    , should_stop_(should_stop) {}

LogStreamBroadcaster::~LogStreamBroadcaster() = default;

void LogStreamBroadcaster::register_routes(httplib::Server& server) {
    server.Get(R"(/api/sessions/([A-Za-z0-9_\-]+)/logs)",
               [this](httplib::Request const& req, httplib::Response& res) {
                   handle_logs_request(req, res);
               });
}

void LogStreamBroadcaster::handle_logs_request(httplib::Request const& req, httplib::Response& res) {
    if (req.matches.size() < 2) {
        respond_bad_request(res, "invalid route");
        return;
    }
    std::string session_id = req.matches[1];
    if (!is_valid_session_id(session_id)) {
        respond_bad_request(res, "invalid session id");
        return;
    }

    auto idle_timeout = read_int_param(req,
                                       "idle_timeout",
                                       ctx_.options.default_idle_timeout_seconds,
                                       kMinIdleTimeoutSeconds,
                                       kMaxIdleTimeoutSeconds);
    if (!idle_timeout) {
        respond_bad_request(res,
                            "idle_timeout must be an integer between " + std::to_string(kMinIdleTimeoutSeconds)
                                + " and " + std::to_string(kMaxIdleTimeoutSeconds));
        return;
    }

    auto log = ctx_.registry.sink_for(session_id);
    if (!log) {
        respond_not_found(res, "Session not found");
        return;
    }
    std::error_code ec;
    if (!std::filesystem::exists((*log)->path(), ec)) {
        respond_not_found(res, "Log file not found");
        return;
    }
    ctx_.registry.touch(session_id);

    TailStreamOptions options{};
    options.idle_timeout  = std::chrono::seconds{*idle_timeout};
    options.poll_interval = std::chrono::milliseconds{ctx_.options.poll_interval_ms};

    auto stream = std::make_shared<LogTailStream>(std::move(*log), should_stop_, options);
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    active_streams_.fetch_add(1);
    ls_log("Streaming logs for session " + session_id, "LogStreamBroadcaster", "INFO");
    res.set_chunked_content_provider(
        "text/event-stream",
        [stream](size_t, httplib::DataSink& sink) {
            return stream->pump(sink);
        },
        [stream, this](bool done) {
            stream->cancel();
            stream->finalize(done);
            active_streams_.fetch_sub(1);
        });
}

} // namespace LS::Web
