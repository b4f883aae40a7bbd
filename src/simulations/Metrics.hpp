#pragma once

#include <span>

#include "os/Process.hpp"
#include "simulations/Schedule.hpp"

namespace Simulations
{

// Rounds to the nearest hundredth, ties to even, the precision every reported metric is kept at.
[[nodiscard]] auto round_to_hundredths(double value) -> double;

// Reduces a complete schedule to waiting/turnaround/utilization statistics. Processes that never
// appear in the schedule count towards total_processes only.
[[nodiscard]] auto calculate_metrics(std::span<const Os::Process> processes, const Schedule& schedule) -> Metrics;

} // namespace Simulations
