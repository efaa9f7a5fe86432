#pragma once

#include <logstream/core/Error.hpp>
#include <logstream/session/LogSink.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace LS {

// Keyed single-instance cache of LogSinks: at most one sink exists per session
// id. Acquiring an id that already has a sink returns that same sink, cleared
// when requested.
class LogSinkStore {
public:
    explicit LogSinkStore(std::filesystem::path logs_dir);

    auto acquire(std::string const& session_id, bool clear_existing) -> Expected<std::shared_ptr<LogSink>>;

    [[nodiscard]] auto find(std::string const& session_id) const -> std::shared_ptr<LogSink>;

    // Closes the sink and deletes its file. Returns true when a file was removed.
    auto release(std::string const& session_id) -> bool;

    // Closes every sink and deletes every *.log file in the logs directory,
    // including ones left behind by earlier runs. Returns the number deleted.
    auto release_all() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto path_for(std::string const& session_id) const -> std::filesystem::path;
    [[nodiscard]] auto logs_dir() const -> std::filesystem::path const& { return logs_dir_; }

private:
    std::filesystem::path                                      logs_dir_;
    mutable std::mutex                                         mutex_;
    phmap::flat_hash_map<std::string, std::shared_ptr<LogSink>> sinks_;
};

} // namespace LS
