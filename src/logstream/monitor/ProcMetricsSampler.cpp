#include <logstream/monitor/ProcMetricsSampler.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace LS::Monitor {

namespace {

auto sampling_fault(std::string message) -> Error {
    return Error{Error::Code::SamplingFault, std::move(message)};
}

// Value of a "Key:   1234 kB" line in a procfs status-style file, in kB.
auto read_kb_field(std::filesystem::path const& file, std::string_view key) -> std::optional<std::uint64_t> {
    std::ifstream in{file};
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() > key.size() && line.compare(0, key.size(), key) == 0 && line[key.size()] == ':') {
            std::istringstream fields{line.substr(key.size() + 1)};
            std::uint64_t      value = 0;
            if (fields >> value) {
                return value;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

auto read_first_line(std::filesystem::path const& file) -> std::optional<std::string> {
    std::ifstream in{file};
    std::string   line;
    if (!in || !std::getline(in, line)) {
        return std::nullopt;
    }
    return line;
}

auto is_pid_directory(std::string const& name) -> bool {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

} // namespace

ProcMetricsSampler::ProcMetricsSampler(std::filesystem::path proc_root)
    : proc_root_{std::move(proc_root)} {}

auto ProcMetricsSampler::sample() -> Expected<MetricsSample> {
    MetricsSample sample{};

    auto const meminfo  = proc_root_ / "meminfo";
    auto const total_kb = read_kb_field(meminfo, "MemTotal");
    auto const avail_kb = read_kb_field(meminfo, "MemAvailable");
    if (!total_kb || !avail_kb || *total_kb == 0) {
        return std::unexpected(sampling_fault("unable to read " + meminfo.string()));
    }
    sample.ram_percent = 100.0 * static_cast<double>(*total_kb - std::min(*avail_kb, *total_kb))
                         / static_cast<double>(*total_kb);

    double loads[3]{};
    if (getloadavg(loads, 3) == 3) {
        sample.load1  = loads[0];
        sample.load5  = loads[1];
        sample.load15 = loads[2];
    }

    auto const page_size = static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE));
    if (auto statm = read_first_line(proc_root_ / "self" / "statm")) {
        std::istringstream fields{*statm};
        std::uint64_t      size_pages = 0;
        std::uint64_t      rss_pages  = 0;
        if (fields >> size_pages >> rss_pages) {
            sample.process_rss_bytes = rss_pages * page_size;
        }
    }

    if (auto stat = read_first_line(proc_root_ / "self" / "stat")) {
        // Fields after the parenthesised command name; utime and stime are
        // fields 14 and 15 of the full line.
        auto const close = stat->rfind(')');
        if (close != std::string::npos) {
            std::istringstream fields{stat->substr(close + 2)};
            std::string        token;
            unsigned long long utime = 0;
            unsigned long long stime = 0;
            for (int index = 3; fields >> token; ++index) {
                if (index == 14) {
                    utime = std::strtoull(token.c_str(), nullptr, 10);
                } else if (index == 15) {
                    stime = std::strtoull(token.c_str(), nullptr, 10);
                    break;
                }
            }
            auto const ticks       = static_cast<double>(sysconf(_SC_CLK_TCK));
            auto const cpu_seconds = ticks > 0 ? static_cast<double>(utime + stime) / ticks : 0.0;
            auto const now         = std::chrono::steady_clock::now();

            std::lock_guard const lock{mutex_};
            if (last_cpu_) {
                auto const wall = std::chrono::duration<double>(now - last_cpu_->at).count();
                if (wall > 0.0) {
                    sample.cpu_percent = std::max(0.0, 100.0 * (cpu_seconds - last_cpu_->cpu_seconds) / wall);
                }
            }
            last_cpu_ = CpuMark{now, cpu_seconds};
        }
    }

    std::error_code ec;
    std::vector<ProcessUsage> processes;
    for (auto const& entry : std::filesystem::directory_iterator{proc_root_, ec}) {
        auto const name = entry.path().filename().string();
        if (!is_pid_directory(name)) {
            continue;
        }
        auto const status = entry.path() / "status";
        auto const rss_kb = read_kb_field(status, "VmRSS");
        if (!rss_kb) {
            continue; // kernel threads and processes that exited mid-scan
        }
        std::string command = "unknown";
        if (auto comm = read_first_line(entry.path() / "comm")) {
            command = *comm;
        }
        processes.push_back(ProcessUsage{
            .name        = std::move(command),
            .pid         = std::atoi(name.c_str()),
            .ram_percent = 100.0 * static_cast<double>(*rss_kb) / static_cast<double>(*total_kb),
        });
    }
    auto const keep = std::min(processes.size(), kMaxTopProcesses);
    std::partial_sort(processes.begin(), processes.begin() + static_cast<std::ptrdiff_t>(keep), processes.end(),
                      [](ProcessUsage const& lhs, ProcessUsage const& rhs) { return lhs.ram_percent > rhs.ram_percent; });
    processes.resize(keep);
    sample.top_processes = std::move(processes);

    return sample;
}

} // namespace LS::Monitor
