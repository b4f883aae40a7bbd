#pragma once

#include <span>
#include <utility>
#include <vector>

#include "os/Process.hpp"
#include "simulations/Scheduler.hpp"

namespace Simulations
{

struct [[nodiscard]] Comparison final
{
    SchedulePolicy policy;
    Result         result;
};

// Runs every policy on its own copy of `processes`, one task per policy. Results come back in
// ALL_SCHEDULE_POLICIES order regardless of which task finishes first.
[[nodiscard]] auto simulate_all(std::span<const Os::Process> processes, double time_quantum = DEFAULT_TIME_QUANTUM)
  -> std::vector<Comparison>;

} // namespace Simulations
