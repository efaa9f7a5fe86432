#define CPPHTTPLIB_NO_EXCEPTIONS
#include <httplib.h>

#include <doctest/doctest.h>

#include "unit/LogStreamTestHelper.hpp"

#include <logstream/web/streaming/LogStreamBroadcaster.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace LS;
using namespace LS::Web;
using namespace std::chrono_literals;
using LS::Testing::TempDir;

namespace {

struct CollectingSink {
    httplib::DataSink sink;
    std::string       buffer;
    bool              done = false;

    CollectingSink() {
        sink.write = [this](char const* data, size_t len) {
            buffer.append(data, len);
            return true;
        };
        sink.done = [this]() { done = true; };
    }

    // Payloads of every complete frame, decoded from their JSON string form.
    auto frames() const -> std::vector<std::string> {
        std::vector<std::string> out;
        std::size_t              begin = 0;
        while (true) {
            auto end = buffer.find("\n\n", begin);
            if (end == std::string::npos) {
                break;
            }
            auto block = buffer.substr(begin, end - begin);
            REQUIRE(block.rfind("data: ", 0) == 0);
            out.push_back(nlohmann::json::parse(block.substr(6)).get<std::string>());
            begin = end + 2;
        }
        return out;
    }
};

auto pump_until_finished(LogTailStream& stream, CollectingSink& sink, std::chrono::milliseconds limit) -> bool {
    auto const deadline = std::chrono::steady_clock::now() + limit;
    while (!stream.finished() && std::chrono::steady_clock::now() < deadline) {
        if (!stream.pump(sink.sink)) {
            return false;
        }
    }
    return stream.finished();
}

struct TailFixture {
    TempDir                  dir;
    std::atomic<bool>        should_stop{false};
    std::shared_ptr<LogSink> log = std::make_shared<LogSink>("tail", dir.path() / "session_tail.log");

    TailFixture() {
        REQUIRE(log->open());
    }

    auto options(std::chrono::milliseconds idle = 1s) const -> TailStreamOptions {
        TailStreamOptions options{};
        options.idle_timeout  = idle;
        options.poll_interval = 20ms;
        return options;
    }
};

} // namespace

TEST_SUITE("web.tail_stream") {
TEST_CASE("frames encode lines as JSON strings") {
    CHECK(encode_log_frame("hello") == "data: \"hello\"\n\n");
    CHECK(encode_log_frame("say \"hi\"") == "data: \"say \\\"hi\\\"\"\n\n");
    CHECK(encode_log_frame("") == "data: \"\"\n\n");
}

TEST_CASE_FIXTURE(TailFixture, "existing lines are replayed in order") {
    REQUIRE(log->append(LogLevel::Info, "first"));
    REQUIRE(log->append(LogLevel::Warning, "second"));

    LogTailStream  stream{log, should_stop, options()};
    CollectingSink sink;
    CHECK(stream.pump(sink.sink));

    auto frames = sink.frames();
    REQUIRE(frames.size() == 2);
    CHECK(frames[0].find("INFO - first") != std::string::npos);
    CHECK(frames[1].find("WARNING - second") != std::string::npos);
    CHECK(stream.lines_sent() == 2);
    CHECK_FALSE(stream.finished());
}

TEST_CASE_FIXTURE(TailFixture, "lines appended later are delivered") {
    LogTailStream  stream{log, should_stop, options(5s)};
    CollectingSink sink;
    CHECK(stream.pump(sink.sink));
    CHECK(sink.frames().empty());

    std::atomic<bool> appended{false};
    std::thread       writer{[&] {
        std::this_thread::sleep_for(50ms);
        appended = log->append(LogLevel::Error, "late arrival").has_value();
    }};
    auto const deadline = std::chrono::steady_clock::now() + 2s;
    while (stream.lines_sent() == 0 && std::chrono::steady_clock::now() < deadline) {
        CHECK(stream.pump(sink.sink));
    }
    writer.join();
    CHECK(appended.load());

    auto frames = sink.frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].find("ERROR - late arrival") != std::string::npos);
}

TEST_CASE_FIXTURE(TailFixture, "an idle stream ends with the timeout frame") {
    REQUIRE(log->append(LogLevel::Info, "only line"));

    LogTailStream  stream{log, should_stop, options(1s)};
    CollectingSink sink;
    auto const     started = std::chrono::steady_clock::now();
    CHECK(pump_until_finished(stream, sink, 5s));
    auto const elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed >= 1s);
    CHECK(elapsed < 3s);
    CHECK(sink.done);
    CHECK(stream.status());

    auto frames = sink.frames();
    REQUIRE(frames.size() == 2);
    CHECK(frames.back() == kIdleTimeoutMessage);
    CHECK_FALSE(stream.pump(sink.sink));
}

TEST_CASE_FIXTURE(TailFixture, "the shutdown flag ends the stream without a timeout frame") {
    LogTailStream  stream{log, should_stop, options(30s)};
    CollectingSink sink;
    CHECK(stream.pump(sink.sink));

    should_stop = true;
    CHECK(stream.pump(sink.sink));
    CHECK(stream.finished());
    CHECK(sink.done);
    CHECK(sink.frames().empty());
}

TEST_CASE_FIXTURE(TailFixture, "cancel ends the stream") {
    LogTailStream  stream{log, should_stop, options(30s)};
    CollectingSink sink;
    stream.cancel();
    CHECK(stream.pump(sink.sink));
    CHECK(stream.finished());
    CHECK(sink.done);
}

TEST_CASE_FIXTURE(TailFixture, "a missing file yields one error frame") {
    REQUIRE(log->remove_artifact());

    LogTailStream  stream{log, should_stop, options()};
    CollectingSink sink;
    CHECK(stream.pump(sink.sink));
    CHECK(stream.finished());
    CHECK(sink.done);

    auto frames = sink.frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].rfind("Log file not found: ", 0) == 0);

    auto status = stream.status();
    REQUIRE_FALSE(status);
    CHECK(status.error().code == Error::Code::NotFound);
}

TEST_CASE_FIXTURE(TailFixture, "a failed write stops the stream") {
    REQUIRE(log->append(LogLevel::Info, "undeliverable"));

    LogTailStream     stream{log, should_stop, options()};
    httplib::DataSink broken;
    broken.write = [](char const*, size_t) { return false; };
    broken.done  = []() {};
    CHECK_FALSE(stream.pump(broken));
}
}
