#include <logstream/session/LogSinkStore.hpp>

#include <logstream/log/TaggedLogger.hpp>

#include <system_error>
#include <utility>

namespace LS {

LogSinkStore::LogSinkStore(std::filesystem::path logs_dir)
    : logs_dir_{std::move(logs_dir)} {}

auto LogSinkStore::path_for(std::string const& session_id) const -> std::filesystem::path {
    return logs_dir_ / log_file_name(session_id);
}

auto LogSinkStore::acquire(std::string const& session_id, bool clear_existing) -> Expected<std::shared_ptr<LogSink>> {
    std::lock_guard const lock{mutex_};
    if (auto it = sinks_.find(session_id); it != sinks_.end()) {
        auto sink = it->second;
        if (auto opened = sink->open(); !opened) {
            return std::unexpected(opened.error());
        }
        if (clear_existing) {
            if (auto cleared = sink->truncate(); !cleared) {
                return std::unexpected(cleared.error());
            }
        }
        return sink;
    }

    auto sink = std::make_shared<LogSink>(session_id, path_for(session_id));
    if (auto opened = sink->open(); !opened) {
        return std::unexpected(opened.error());
    }
    if (clear_existing) {
        if (auto cleared = sink->truncate(); !cleared) {
            return std::unexpected(cleared.error());
        }
    }
    sinks_.emplace(session_id, sink);
    return sink;
}

auto LogSinkStore::find(std::string const& session_id) const -> std::shared_ptr<LogSink> {
    std::lock_guard const lock{mutex_};
    if (auto it = sinks_.find(session_id); it != sinks_.end()) {
        return it->second;
    }
    return nullptr;
}

auto LogSinkStore::release(std::string const& session_id) -> bool {
    std::shared_ptr<LogSink> sink;
    {
        std::lock_guard const lock{mutex_};
        auto                  it = sinks_.find(session_id);
        if (it == sinks_.end()) {
            return false;
        }
        sink = std::move(it->second);
        sinks_.erase(it);
    }
    return sink->remove_artifact();
}

auto LogSinkStore::release_all() -> std::size_t {
    std::lock_guard const lock{mutex_};
    for (auto& [id, sink] : sinks_) {
        sink->close();
    }
    sinks_.clear();

    std::size_t     deleted = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(logs_dir_, ec)) {
        return deleted;
    }
    for (auto const& entry : std::filesystem::directory_iterator{logs_dir_, ec}) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".log") {
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(entry.path(), remove_ec)) {
            ++deleted;
        } else if (remove_ec) {
            ls_log("Failed to delete " + entry.path().string() + ": " + remove_ec.message(), "LogSinkStore", "ERROR");
        }
    }
    if (ec) {
        ls_log("Error scanning " + logs_dir_.string() + ": " + ec.message(), "LogSinkStore", "ERROR");
    }
    ls_log("Deleted " + std::to_string(deleted) + " log files", "LogSinkStore", "INFO");
    return deleted;
}

auto LogSinkStore::size() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return sinks_.size();
}

} // namespace LS
