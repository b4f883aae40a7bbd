#include "Workload.hpp"

#include <algorithm>

#include "simulations/Metrics.hpp"

namespace Simulations
{

auto Workload::contains(const std::string_view pid) const -> bool
{
    return std::ranges::any_of(processes, [&](const auto& process) { return process.pid == pid; });
}

auto Workload::emplace_random_process() -> Os::Process&
{
    return processes.emplace_back(random_process(next_free_pid(), max_arrival_time));
}

void Workload::randomize(const std::size_t count, const double arrival_spread)
{
    processes.clear();
    processes.reserve(count);

    const auto max_arrival = static_cast<double>(count) * arrival_spread;
    for (std::size_t idx = 1; idx <= count; ++idx) {
        processes.push_back(random_process("P" + std::to_string(idx), max_arrival));
    }
}

auto Workload::random_process(std::string pid, const double max_arrival) -> Os::Process
{
    std::uniform_real_distribution<double> arrival_dist(0.0, max_arrival);
    std::uniform_real_distribution<double> burst_dist(min_burst_time, max_burst_time);
    std::uniform_int_distribution<int>     priority_dist(1, std::max(1, max_priority));

    // two decimals, like every reported metric
    const auto arrival  = round_to_hundredths(arrival_dist(generator));
    const auto burst    = std::max(round_to_hundredths(burst_dist(generator)), min_burst_time);
    const auto priority = priority_dist(generator);

    return Os::Process {
        .pid          = std::move(pid),
        .arrival_time = arrival,
        .burst_time   = burst,
        .priority     = priority,
    };
}

auto Workload::next_free_pid() const -> std::string
{
    for (std::size_t idx = 1;; ++idx) {
        auto pid = "P" + std::to_string(idx);
        if (!contains(pid)) { return pid; }
    }
}

} // namespace Simulations
