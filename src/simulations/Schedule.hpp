#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Simulations
{

struct [[nodiscard]] ScheduleEntry final
{
    // std::nullopt marks the CPU as idle for [start_time, end_time)
    std::optional<std::string> pid;
    double                     start_time = 0.0;
    double                     end_time   = 0.0;

    [[nodiscard]] auto idle() const -> bool { return !pid.has_value(); }

    [[nodiscard]] auto duration() const -> double { return end_time - start_time; }

    [[nodiscard]] auto operator==(const ScheduleEntry&) const -> bool = default;
};

using Schedule = std::vector<ScheduleEntry>;

// Appends [start_time, end_time) to the schedule. Empty intervals are dropped and an interval that
// continues the last entry of the same process is merged into it.
inline void record(Schedule& schedule, std::optional<std::string> pid, const double start_time, const double end_time)
{
    if (!(start_time < end_time)) { return; }

    if (!schedule.empty()) {
        auto& last = schedule.back();
        if (last.pid == pid && last.end_time == start_time) {
            last.end_time = end_time;
            return;
        }
    }

    schedule.push_back(ScheduleEntry { .pid = std::move(pid), .start_time = start_time, .end_time = end_time });
}

struct [[nodiscard]] ProcessMetrics final
{
    std::string pid;
    double      completion_time = 0.0;
    double      turnaround_time = 0.0;
    double      waiting_time    = 0.0;

    [[nodiscard]] auto operator==(const ProcessMetrics&) const -> bool = default;
};

struct [[nodiscard]] Metrics final
{
    double      average_turnaround_time = 0.0;
    double      average_waiting_time    = 0.0;
    double      cpu_utilization         = 0.0;
    std::size_t total_processes         = 0;
    double      total_time              = 0.0;

    std::vector<ProcessMetrics> per_process;

    [[nodiscard]] auto operator==(const Metrics&) const -> bool = default;
};

struct [[nodiscard]] SchedulingResult final
{
    Schedule               schedule;
    std::optional<Metrics> metrics;
    std::string            algorithm_name;
};

enum class SchedulingErrorKind : std::uint8_t
{
    MissingPriority = 0,
    InvalidTimeQuantum,
    Count,
};

struct [[nodiscard]] SchedulingError final
{
    SchedulingErrorKind kind;
    std::string         message;
};

} // namespace Simulations
