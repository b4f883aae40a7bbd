#include "Comparison.hpp"

#include <future>

namespace Simulations
{

auto simulate_all(const std::span<const Os::Process> processes, const double time_quantum) -> std::vector<Comparison>
{
    std::vector<std::future<Result>> tasks;
    tasks.reserve(ALL_SCHEDULE_POLICIES.size());

    for (const auto policy : ALL_SCHEDULE_POLICIES) {
        tasks.push_back(std::async(
          std::launch::async,
          [policy, time_quantum, input = std::vector(processes.begin(), processes.end())] {
              return simulate(policy, input, time_quantum);
          }
        ));
    }

    std::vector<Comparison> comparisons;
    comparisons.reserve(tasks.size());
    for (std::size_t idx = 0; idx < tasks.size(); ++idx) {
        comparisons.push_back(Comparison { .policy = ALL_SCHEDULE_POLICIES[idx], .result = tasks[idx].get() });
    }

    return comparisons;
}

} // namespace Simulations
