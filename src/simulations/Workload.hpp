#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "os/Process.hpp"
#include "simulations/Scheduler.hpp"

namespace Simulations
{

// A process list together with the configuration it is meant to be scheduled with.
struct [[nodiscard]] Workload final
{
    constexpr static auto GUI_ARRIVAL_SPREAD   = 0.5;
    constexpr static auto BENCH_ARRIVAL_SPREAD = 0.1;

    std::vector<Os::Process> processes;

    SchedulePolicy schedule_policy = SchedulePolicy::FirstComeFirstServed;
    double         time_quantum    = DEFAULT_TIME_QUANTUM;

    // Bounds used by random generation
    double max_arrival_time = 10.0;
    double min_burst_time   = 1.0;
    double max_burst_time   = 10.0;
    int    max_priority     = 10;

    std::mt19937 generator { std::random_device {}() };

    [[nodiscard]] auto contains(std::string_view pid) const -> bool;

    template<typename... Args>
    auto emplace_process(Args&&... args) -> Os::Process&
    {
        return processes.emplace_back(Os::Process { std::forward<Args>(args)... });
    }

    // Adds a process named after the first unused `P<n>`.
    auto emplace_random_process() -> Os::Process&;

    // Replaces every process with `count` random ones named P1..Pcount, arriving within
    // [0, count * arrival_spread].
    void randomize(std::size_t count, double arrival_spread = GUI_ARRIVAL_SPREAD);

    void reseed(std::uint32_t seed) { generator.seed(seed); }

    [[nodiscard]] auto simulate() const -> Result { return Simulations::simulate(schedule_policy, processes, time_quantum); }

  private:
    [[nodiscard]] auto random_process(std::string pid, double max_arrival) -> Os::Process;
    [[nodiscard]] auto next_free_pid() const -> std::string;
};

} // namespace Simulations
