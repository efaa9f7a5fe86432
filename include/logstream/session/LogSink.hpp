#pragma once

#include <logstream/core/Error.hpp>
#include <logstream/session/LogLevel.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace LS {

// Forward-only view of a session log file. Each reader owns its own handle and
// position, never writes, and never blocks: when the writer has not produced a
// complete line yet, next_line() yields an empty optional.
class LogReader {
public:
    explicit LogReader(std::filesystem::path path);

    LogReader(LogReader&&) noexcept            = default;
    LogReader& operator=(LogReader&&) noexcept = default;

    [[nodiscard]] auto open() -> Expected<void>;

    // A complete line without its trailing newline, or nullopt when no
    // complete line is available yet.
    [[nodiscard]] auto next_line() -> Expected<std::optional<std::string>>;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream         stream_;
    std::string           pending_;
};

// Append-only, file-backed log for one session: <logs_dir>/session_<id>.log.
class LogSink {
public:
    LogSink(std::string session_id, std::filesystem::path path);
    ~LogSink();

    LogSink(LogSink const&)            = delete;
    LogSink& operator=(LogSink const&) = delete;

    // Creates the file (and its directory) if needed.
    [[nodiscard]] auto open() -> Expected<void>;

    // Writes "<timestamp> - <LEVEL> - <message>" as one line and flushes.
    // Fails with ResourceFault once the sink is closed.
    auto append(LogLevel level, std::string_view message) -> Expected<void>;

    auto truncate() -> Expected<void>;

    [[nodiscard]] auto open_reader() const -> Expected<LogReader>;

    void close();

    // Closes the sink and deletes the file. Returns true when a file was removed.
    auto remove_artifact() -> bool;

    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto session_id() const -> std::string const& { return session_id_; }
    [[nodiscard]] auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::string           session_id_;
    std::filesystem::path path_;
    mutable std::mutex    mutex_;
    std::ofstream         stream_;
    bool                  closed_{true};
};

[[nodiscard]] auto log_file_name(std::string_view session_id) -> std::string;

} // namespace LS
