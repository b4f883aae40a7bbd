#include "Metrics.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <unordered_map>

#include "Util.hpp"

namespace Simulations
{

auto round_to_hundredths(const double value) -> double
{
    // std::format rounds the exact binary value, ties to even
    return Util::parse_double(std::format("{:.2f}", value)).value_or(value);
}

auto calculate_metrics(const std::span<const Os::Process> processes, const Schedule& schedule) -> Metrics
{
    std::unordered_map<std::string, double> completion_times;
    double                                  busy_time  = 0.0;
    double                                  total_time = 0.0;

    for (const auto& entry : schedule) {
        total_time = std::max(total_time, entry.end_time);
        if (entry.idle()) { continue; }

        completion_times[*entry.pid] = entry.end_time;
        busy_time += entry.duration();
    }

    Metrics metrics { .total_processes = processes.size() };

    double total_turnaround_time = 0.0;
    double total_waiting_time    = 0.0;
    for (const auto& process : processes) {
        const auto it = completion_times.find(process.pid);
        if (it == completion_times.end()) { continue; }

        const auto completion_time = it->second;
        const auto turnaround_time = completion_time - process.arrival_time;
        const auto waiting_time    = turnaround_time - process.burst_time;

        total_turnaround_time += turnaround_time;
        total_waiting_time += waiting_time;

        metrics.per_process.push_back(ProcessMetrics {
          .pid             = process.pid,
          .completion_time = round_to_hundredths(completion_time),
          .turnaround_time = round_to_hundredths(turnaround_time),
          .waiting_time    = round_to_hundredths(waiting_time),
        });
    }

    if (!metrics.per_process.empty()) {
        const auto completed            = static_cast<double>(metrics.per_process.size());
        metrics.average_turnaround_time = round_to_hundredths(total_turnaround_time / completed);
        metrics.average_waiting_time    = round_to_hundredths(total_waiting_time / completed);
    }

    metrics.total_time      = round_to_hundredths(total_time);
    metrics.cpu_utilization = total_time > 0.0 ? round_to_hundredths(busy_time / total_time * 100.0) : 0.0;

    return metrics;
}

} // namespace Simulations
