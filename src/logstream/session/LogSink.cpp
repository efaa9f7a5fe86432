#include <logstream/session/LogSink.hpp>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/util/TimeUtils.hpp>

#include <chrono>
#include <system_error>
#include <utility>

namespace LS {

auto log_file_name(std::string_view session_id) -> std::string {
    std::string name{"session_"};
    name.append(session_id);
    name.append(".log");
    return name;
}

LogReader::LogReader(std::filesystem::path path)
    : path_{std::move(path)} {}

auto LogReader::open() -> Expected<void> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::unexpected(Error{Error::Code::NotFound, "Log file not found: " + path_.string()});
    }
    stream_.open(path_, std::ios::in | std::ios::binary);
    if (!stream_.is_open()) {
        return std::unexpected(Error{Error::Code::ResourceFault, "unable to open " + path_.string()});
    }
    return {};
}

auto LogReader::next_line() -> Expected<std::optional<std::string>> {
    if (!stream_.is_open()) {
        return std::unexpected(Error{Error::Code::ResourceFault, "reader is not open"});
    }
    if (stream_.bad()) {
        return std::unexpected(Error{Error::Code::ResourceFault, "read failure on " + path_.string()});
    }

    std::string chunk;
    std::getline(stream_, chunk);
    if (stream_.bad()) {
        return std::unexpected(Error{Error::Code::ResourceFault, "read failure on " + path_.string()});
    }
    if (stream_.eof()) {
        // Partial line: keep what we have and retry from the same place once
        // the writer has finished it.
        pending_.append(chunk);
        stream_.clear();
        return std::optional<std::string>{};
    }
    if (stream_.fail()) {
        stream_.clear();
        return std::optional<std::string>{};
    }

    if (!pending_.empty()) {
        chunk.insert(0, pending_);
        pending_.clear();
    }
    return std::optional<std::string>{std::move(chunk)};
}

LogSink::LogSink(std::string session_id, std::filesystem::path path)
    : session_id_{std::move(session_id)}
    , path_{std::move(path)} {}

LogSink::~LogSink() {
    close();
}

auto LogSink::open() -> Expected<void> {
    std::lock_guard const lock{mutex_};
    if (!closed_) {
        return {};
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::ResourceFault,
                                         "unable to create " + path_.parent_path().string() + ": " + ec.message()});
        }
    }
    stream_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!stream_.is_open()) {
        return std::unexpected(Error{Error::Code::ResourceFault, "unable to open " + path_.string()});
    }
    closed_ = false;
    return {};
}

auto LogSink::append(LogLevel level, std::string_view message) -> Expected<void> {
    auto prefix = format_log_timestamp(std::chrono::system_clock::now());

    std::lock_guard const lock{mutex_};
    if (closed_) {
        return std::unexpected(Error{Error::Code::ResourceFault, "log sink for session " + session_id_ + " is closed"});
    }
    stream_ << prefix << " - " << to_string(level) << " - " << message << '\n';
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        return std::unexpected(Error{Error::Code::ResourceFault, "write failure on " + path_.string()});
    }
    return {};
}

auto LogSink::truncate() -> Expected<void> {
    {
        std::lock_guard const lock{mutex_};
        if (closed_) {
            return std::unexpected(Error{Error::Code::ResourceFault, "log sink for session " + session_id_ + " is closed"});
        }
        stream_.close();
        stream_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!stream_.is_open()) {
            closed_ = true;
            return std::unexpected(Error{Error::Code::ResourceFault, "unable to truncate " + path_.string()});
        }
    }
    ls_log("Log file cleared for session " + session_id_, "LogSink", "INFO");
    return {};
}

auto LogSink::open_reader() const -> Expected<LogReader> {
    LogReader reader{path_};
    if (auto opened = reader.open(); !opened) {
        return std::unexpected(opened.error());
    }
    return reader;
}

void LogSink::close() {
    std::lock_guard const lock{mutex_};
    if (closed_) {
        return;
    }
    stream_.close();
    closed_ = true;
}

auto LogSink::remove_artifact() -> bool {
    close();
    std::error_code ec;
    auto            removed = std::filesystem::remove(path_, ec);
    if (ec) {
        ls_log("Failed to delete " + path_.string() + ": " + ec.message(), "LogSink", "ERROR");
        return false;
    }
    return removed;
}

auto LogSink::closed() const -> bool {
    std::lock_guard const lock{mutex_};
    return closed_;
}

} // namespace LS
