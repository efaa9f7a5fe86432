#include <doctest/doctest.h>

#include "unit/LogStreamTestHelper.hpp"

#include <logstream/session/LogSink.hpp>

#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace LS;
using LS::Testing::TempDir;
using LS::Testing::read_lines;

TEST_SUITE("session.log_sink") {
TEST_CASE("append writes prefixed lines in order") {
    TempDir dir;
    LogSink sink{"abc", dir.path() / log_file_name("abc")};
    REQUIRE(sink.open());

    REQUIRE(sink.append(LogLevel::Info, "first"));
    REQUIRE(sink.append(LogLevel::Warning, "second"));
    REQUIRE(sink.append(LogLevel::Critical, "third"));

    CHECK(sink.path().filename() == "session_abc.log");
    auto lines = read_lines(sink.path());
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].ends_with(" - INFO - first"));
    CHECK(lines[1].ends_with(" - WARNING - second"));
    CHECK(lines[2].ends_with(" - CRITICAL - third"));
    // YYYY-MM-DD HH:MM:SS,mmm
    CHECK(lines[0].size() > 23);
    CHECK(lines[0][4] == '-');
    CHECK(lines[0][10] == ' ');
    CHECK(lines[0][19] == ',');
}

TEST_CASE("open creates missing directories") {
    TempDir dir;
    LogSink sink{"nested", dir.path() / "a" / "b" / log_file_name("nested")};
    REQUIRE(sink.open());
    CHECK(std::filesystem::exists(sink.path()));
}

TEST_CASE("truncate discards existing content") {
    TempDir dir;
    LogSink sink{"t", dir.path() / log_file_name("t")};
    REQUIRE(sink.open());
    REQUIRE(sink.append(LogLevel::Info, "old"));
    REQUIRE(sink.truncate());
    REQUIRE(sink.append(LogLevel::Info, "new"));

    auto lines = read_lines(sink.path());
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].ends_with("new"));
}

TEST_CASE("append after close fails without throwing") {
    TempDir dir;
    LogSink sink{"closed", dir.path() / log_file_name("closed")};
    REQUIRE(sink.open());
    sink.close();
    CHECK(sink.closed());
    auto result = sink.append(LogLevel::Info, "late");
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::ResourceFault);
}

TEST_CASE("remove_artifact deletes the file and closes the sink") {
    TempDir dir;
    LogSink sink{"gone", dir.path() / log_file_name("gone")};
    REQUIRE(sink.open());
    CHECK(sink.remove_artifact());
    CHECK_FALSE(std::filesystem::exists(sink.path()));
    CHECK_FALSE(sink.append(LogLevel::Info, "after removal"));
    CHECK_FALSE(sink.remove_artifact());
}

TEST_CASE("concurrent appends never interleave within a line") {
    TempDir dir;
    LogSink sink{"mt", dir.path() / log_file_name("mt")};
    REQUIRE(sink.open());

    constexpr int kThreads = 4;
    constexpr int kLines   = 200;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&sink, t] {
            for (int i = 0; i < kLines; ++i) {
                auto written = sink.append(LogLevel::Info, "writer-" + std::to_string(t) + "-line-" + std::to_string(i));
                (void)written;
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    auto lines = read_lines(sink.path());
    CHECK(lines.size() == kThreads * kLines);
    for (auto const& line : lines) {
        CHECK(line.find(" - INFO - writer-") != std::string::npos);
    }
}
}

TEST_SUITE("session.log_reader") {
TEST_CASE("reader starts at the beginning and follows new lines") {
    TempDir dir;
    LogSink sink{"r", dir.path() / log_file_name("r")};
    REQUIRE(sink.open());
    REQUIRE(sink.append(LogLevel::Info, "one"));

    auto reader = sink.open_reader();
    REQUIRE(reader);

    auto first = reader->next_line();
    REQUIRE(first);
    REQUIRE(first->has_value());
    CHECK((*first)->ends_with("one"));

    auto none = reader->next_line();
    REQUIRE(none);
    CHECK_FALSE(none->has_value());

    REQUIRE(sink.append(LogLevel::Error, "two"));
    auto second = reader->next_line();
    REQUIRE(second);
    REQUIRE(second->has_value());
    CHECK((*second)->ends_with("ERROR - two"));
}

TEST_CASE("partial lines are held back until complete") {
    TempDir dir;
    auto    path = dir.path() / "partial.log";
    {
        std::ofstream out{path};
        out << "complete\npart";
    }
    LogReader reader{path};
    REQUIRE(reader.open());

    auto complete = reader.next_line();
    REQUIRE(complete);
    REQUIRE(complete->has_value());
    CHECK(**complete == "complete");

    auto pending = reader.next_line();
    REQUIRE(pending);
    CHECK_FALSE(pending->has_value());

    {
        std::ofstream out{path, std::ios::app};
        out << "ial\n";
    }
    auto joined = reader.next_line();
    REQUIRE(joined);
    REQUIRE(joined->has_value());
    CHECK(**joined == "partial");
}

TEST_CASE("independent readers keep their own positions") {
    TempDir dir;
    LogSink sink{"two", dir.path() / log_file_name("two")};
    REQUIRE(sink.open());
    REQUIRE(sink.append(LogLevel::Info, "a"));
    REQUIRE(sink.append(LogLevel::Info, "b"));

    auto left  = sink.open_reader();
    auto right = sink.open_reader();
    REQUIRE(left);
    REQUIRE(right);

    auto l1 = left->next_line();
    auto l2 = left->next_line();
    auto r1 = right->next_line();
    REQUIRE((l1 && l2 && r1));
    CHECK((*l1)->ends_with("a"));
    CHECK((*l2)->ends_with("b"));
    CHECK((*r1)->ends_with("a"));
}

TEST_CASE("missing file reports NotFound") {
    TempDir dir;
    LogSink sink{"missing", dir.path() / log_file_name("missing")};
    auto    reader = sink.open_reader();
    REQUIRE_FALSE(reader);
    CHECK(reader.error().code == Error::Code::NotFound);
}
}
