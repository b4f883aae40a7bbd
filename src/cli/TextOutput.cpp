#include "TextOutput.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <sstream>
#include <vector>

#include "simulations/Format.hpp"

[[nodiscard]] static auto row_labels(const Simulations::Schedule& schedule) -> std::vector<std::optional<std::string>>
{
    std::vector<std::optional<std::string>> labels;
    bool                                    idles = false;
    for (const auto& entry : schedule) {
        if (entry.idle()) {
            idles = true;
            continue;
        }

        if (std::ranges::find(labels, entry.pid) == labels.end()) { labels.push_back(entry.pid); }
    }

    if (idles) { labels.emplace_back(std::nullopt); }
    return labels;
}

[[nodiscard]] static auto occupies(
  const Simulations::Schedule&      schedule,
  const std::optional<std::string>& pid,
  const double                      from,
  const double                      to
) -> bool
{
    return std::ranges::any_of(schedule, [&](const auto& entry) {
        return entry.pid == pid && entry.start_time < to && entry.end_time > from;
    });
}

namespace Cli
{

auto process_table(const std::span<const Os::Process> processes) -> std::string
{
    std::stringstream ss;
    ss << std::format("{:<10} {:>10} {:>10} {:>10}\n", "PID", "Arrival", "Burst", "Priority");
    for (const auto& process : processes) {
        const auto priority = process.priority ? std::to_string(*process.priority) : std::string("-");
        ss << std::format(
          "{:<10} {:>10.2f} {:>10.2f} {:>10}\n", process.pid, process.arrival_time, process.burst_time, priority
        );
    }

    return ss.str();
}

auto schedule_listing(const Simulations::Schedule& schedule) -> std::string
{
    std::stringstream ss;
    for (const auto& entry : schedule) { ss << std::format("  {}\n", entry); }

    return ss.str();
}

auto gantt_chart(const Simulations::Schedule& schedule, const std::size_t max_columns) -> std::string
{
    if (schedule.empty() || max_columns == 0) { return {}; }

    const auto total_time = schedule.back().end_time;
    const auto columns    = std::min(max_columns, static_cast<std::size_t>(std::ceil(total_time)));
    const auto step       = total_time / static_cast<double>(std::max(columns, 1UZ));

    const auto labels = row_labels(schedule);
    std::size_t label_width = 4;
    for (const auto& label : labels) { label_width = std::max(label_width, label.value_or("IDLE").size()); }

    std::stringstream ss;
    for (const auto& label : labels) {
        ss << std::format("{:<{}} |", label.value_or("IDLE"), label_width);
        for (std::size_t column = 0; column < columns; ++column) {
            const auto from = static_cast<double>(column) * step;
            const auto to   = from + step;
            ss << (occupies(schedule, label, from, to) ? (label ? '#' : '.') : ' ');
        }
        ss << "|\n";
    }

    const auto end_label = std::format("{:.2f}", total_time);
    ss << std::format("{:<{}} 0{:>{}}\n", "", label_width, end_label, std::max(columns, end_label.size()) + 1);
    return ss.str();
}

auto metrics_table(const Simulations::Metrics& metrics) -> std::string
{
    std::stringstream ss;
    ss << std::format("  {:<26} {:.2f}\n", "Average waiting time", metrics.average_waiting_time);
    ss << std::format("  {:<26} {:.2f}\n", "Average turnaround time", metrics.average_turnaround_time);
    ss << std::format("  {:<26} {:.2f}%\n", "CPU utilization", metrics.cpu_utilization);
    ss << std::format("  {:<26} {}\n", "Total processes", metrics.total_processes);
    ss << std::format("  {:<26} {:.2f}\n", "Total time", metrics.total_time);

    if (!metrics.per_process.empty()) {
        ss << '\n';
        ss << std::format("  {:<10} {:>12} {:>12} {:>12}\n", "PID", "Completion", "Turnaround", "Waiting");
        for (const auto& process : metrics.per_process) {
            ss << std::format(
              "  {:<10} {:>12.2f} {:>12.2f} {:>12.2f}\n",
              process.pid,
              process.completion_time,
              process.turnaround_time,
              process.waiting_time
            );
        }
    }

    return ss.str();
}

auto comparison_table(const std::span<const Simulations::Comparison> comparisons) -> std::string
{
    std::stringstream ss;
    ss << std::format(
      "{:<38} {:>10} {:>12} {:>10} {:>8}\n", "Algorithm", "Avg Wait", "Avg Turnar.", "CPU Util%", "Entries"
    );

    for (const auto& [policy, result] : comparisons) {
        if (!result) {
            ss << std::format("{:<38} error: {}\n", Simulations::schedule_policy_name(policy), result.error());
            continue;
        }

        const auto metrics = result->metrics.value_or(Simulations::Metrics {});
        ss << std::format(
          "{:<38} {:>10.2f} {:>12.2f} {:>10.2f} {:>8}\n",
          result->algorithm_name,
          metrics.average_waiting_time,
          metrics.average_turnaround_time,
          metrics.cpu_utilization,
          result->schedule.size()
        );
    }

    return ss.str();
}

} // namespace Cli
