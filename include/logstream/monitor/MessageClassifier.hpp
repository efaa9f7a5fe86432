#pragma once

#include <logstream/monitor/MetricsSampler.hpp>
#include <logstream/session/LogLevel.hpp>

#include <random>
#include <string>

namespace LS::Monitor {

struct MonitorMessage {
    LogLevel    level = LogLevel::Info;
    std::string text;
};

// Threshold severity of a sample:
//   RAM% > 95 or load1 > 8                  -> Critical
//   RAM% > 90 or load1 > 4                  -> Error
//   RAM% > 80 or load1 > 2 or CPU% > 50     -> Warning
//   otherwise                               -> Info
// An absent load1 never triggers the load rules.
[[nodiscard]] auto classify_severity(MetricsSample const& sample) -> LogLevel;

// Weighted pick among Info (0.7), Warning (0.2) and Error (0.1).
auto pick_weighted_level(std::mt19937& rng) -> LogLevel;

// Text for a line of the given family. Critical is produced only through
// escalation in compose_message.
auto describe_sample(LogLevel family, MetricsSample const& sample, std::mt19937& rng) -> std::string;

// One monitor line: a weighted family pick, escalated to Critical when the
// sample itself classifies as Critical.
auto compose_message(MetricsSample const& sample, std::mt19937& rng) -> MonitorMessage;

} // namespace LS::Monitor
