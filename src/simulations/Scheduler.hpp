#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "os/Process.hpp"
#include "simulations/Metrics.hpp"
#include "simulations/Schedule.hpp"

namespace Simulations
{

constexpr static auto DEFAULT_TIME_QUANTUM = 2.0;

// Preemptive policies re-evaluate their choice once per step, not on every arrival.
constexpr static auto PREEMPTION_STEP = 1.0;

using Result = std::expected<SchedulingResult, SchedulingError>;

struct [[nodiscard]] Job final
{
    explicit Job(Os::Process process_)
      : process { std::move(process_) },
        remaining_time { process.burst_time }
    {}

    // Runs the job for at most `slice` time units and returns how long it actually ran.
    auto execute(const double slice) -> double
    {
        const auto executed = std::min(slice, remaining_time);
        remaining_time -= executed;
        return executed;
    }

    [[nodiscard]] auto complete() const -> bool { return remaining_time <= 0.0; }

    Os::Process process;
    double      remaining_time;
};

struct [[nodiscard]] Simulation final
{
    explicit Simulation(std::span<const Os::Process> processes);

    ~Simulation() = default;

    Simulation(const Simulation&)            = delete;
    Simulation& operator=(const Simulation&) = delete;

    Simulation(Simulation&&) noexcept            = default;
    Simulation& operator=(Simulation&&) noexcept = default;

    [[nodiscard]] auto complete() const -> bool { return finished == jobs.size(); }

    // Records the CPU as idle from the current time up to `time`.
    void idle_until(double time);

    // Runs jobs[job_idx] for at most `slice` time units starting at the current time.
    void run(std::size_t job_idx, double slice);

    // Jobs sorted by (arrival_time, pid), the order in which they become eligible.
    std::vector<Job> jobs;
    Schedule         schedule;
    double           timer    = 0.0;
    std::size_t      finished = 0;
};

template<typename Policy>
concept SchedulingPolicy = requires(const Policy& policy, Simulation& sim, std::span<const Os::Process> processes) {
    { policy.name() } -> std::convertible_to<std::string>;
    { policy.validate(processes) } -> std::same_as<std::optional<SchedulingError>>;
    policy(sim);
};

[[nodiscard]] auto validate_priorities(std::span<const Os::Process> processes) -> std::optional<SchedulingError>;

struct [[nodiscard]] FirstComeFirstServedPolicy final
{
    constexpr static auto POLICY_NAME = "First-Come, First-Served (FCFS)";

    [[nodiscard]] auto name() const -> std::string { return POLICY_NAME; }

    [[nodiscard]] auto validate(std::span<const Os::Process>) const -> std::optional<SchedulingError>
    {
        return std::nullopt;
    }

    void operator()(Simulation& sim) const;
};

struct [[nodiscard]] ShortestJobFirstPolicy final
{
    constexpr static auto POLICY_NAME = "Shortest Job First (Non-Preemptive)";

    [[nodiscard]] auto name() const -> std::string { return POLICY_NAME; }

    [[nodiscard]] auto validate(std::span<const Os::Process>) const -> std::optional<SchedulingError>
    {
        return std::nullopt;
    }

    void operator()(Simulation& sim) const;
};

struct [[nodiscard]] ShortestRemainingTimeFirstPolicy final
{
    constexpr static auto POLICY_NAME = "Shortest Job First (Preemptive)";

    [[nodiscard]] auto name() const -> std::string { return POLICY_NAME; }

    [[nodiscard]] auto validate(std::span<const Os::Process>) const -> std::optional<SchedulingError>
    {
        return std::nullopt;
    }

    void operator()(Simulation& sim) const;
};

struct [[nodiscard]] PriorityPolicy final
{
    constexpr static auto POLICY_NAME = "Priority (Non-Preemptive)";

    [[nodiscard]] auto name() const -> std::string { return POLICY_NAME; }

    [[nodiscard]] auto validate(std::span<const Os::Process> processes) const -> std::optional<SchedulingError>
    {
        return validate_priorities(processes);
    }

    void operator()(Simulation& sim) const;
};

struct [[nodiscard]] PreemptivePriorityPolicy final
{
    constexpr static auto POLICY_NAME = "Priority (Preemptive)";

    [[nodiscard]] auto name() const -> std::string { return POLICY_NAME; }

    [[nodiscard]] auto validate(std::span<const Os::Process> processes) const -> std::optional<SchedulingError>
    {
        return validate_priorities(processes);
    }

    void operator()(Simulation& sim) const;
};

struct [[nodiscard]] RoundRobinPolicy final
{
    constexpr static auto POLICY_NAME = "Round Robin";

    // "Round Robin (Quantum: 2.0)"
    [[nodiscard]] auto name() const -> std::string;

    [[nodiscard]] auto validate(std::span<const Os::Process>) const -> std::optional<SchedulingError>;

    void operator()(Simulation& sim) const;

    double quantum = DEFAULT_TIME_QUANTUM;
};

template<SchedulingPolicy Policy>
[[nodiscard]] auto run(std::span<const Os::Process> processes, const Policy& policy) -> Result
{
    if (auto error = policy.validate(processes); error.has_value()) { return std::unexpected(std::move(*error)); }

    if (processes.empty()) { return SchedulingResult { .algorithm_name = policy.name() }; }

    Simulation sim(processes);
    policy(sim);
    assert(sim.complete() && "policy returned before every job finished");

    auto metrics = calculate_metrics(processes, sim.schedule);
    return SchedulingResult {
        .schedule       = std::move(sim.schedule),
        .metrics        = std::move(metrics),
        .algorithm_name = policy.name(),
    };
}

[[nodiscard]] auto first_come_first_served(std::span<const Os::Process> processes) -> Result;
[[nodiscard]] auto shortest_job_first(std::span<const Os::Process> processes) -> Result;
[[nodiscard]] auto shortest_remaining_time_first(std::span<const Os::Process> processes) -> Result;
[[nodiscard]] auto priority_non_preemptive(std::span<const Os::Process> processes) -> Result;
[[nodiscard]] auto priority_preemptive(std::span<const Os::Process> processes) -> Result;
[[nodiscard]] auto round_robin(std::span<const Os::Process> processes, double time_quantum = DEFAULT_TIME_QUANTUM)
  -> Result;

enum class SchedulePolicy : std::uint8_t
{
    FirstComeFirstServed = 0,
    ShortestJobFirst,
    ShortestRemainingTimeFirst,
    PriorityNonPreemptive,
    PriorityPreemptive,
    RoundRobin,
    Count,
};

constexpr static auto ALL_SCHEDULE_POLICIES = std::array {
    SchedulePolicy::FirstComeFirstServed,
    SchedulePolicy::ShortestJobFirst,
    SchedulePolicy::ShortestRemainingTimeFirst,
    SchedulePolicy::PriorityNonPreemptive,
    SchedulePolicy::PriorityPreemptive,
    SchedulePolicy::RoundRobin,
};

[[nodiscard]] auto simulate(
  SchedulePolicy               policy,
  std::span<const Os::Process> processes,
  double                       time_quantum = DEFAULT_TIME_QUANTUM
) -> Result;

// Display label, "Round Robin" without the quantum.
[[nodiscard]] constexpr auto schedule_policy_name(const SchedulePolicy policy) -> std::string_view
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 6,
      "Exhaustive handling of all variants for enum SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return FirstComeFirstServedPolicy::POLICY_NAME;
        }
        case SchedulePolicy::ShortestJobFirst: {
            return ShortestJobFirstPolicy::POLICY_NAME;
        }
        case SchedulePolicy::ShortestRemainingTimeFirst: {
            return ShortestRemainingTimeFirstPolicy::POLICY_NAME;
        }
        case SchedulePolicy::PriorityNonPreemptive: {
            return PriorityPolicy::POLICY_NAME;
        }
        case SchedulePolicy::PriorityPreemptive: {
            return PreemptivePriorityPolicy::POLICY_NAME;
        }
        case SchedulePolicy::RoundRobin: {
            return RoundRobinPolicy::POLICY_NAME;
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

// Identifier used by workload scripts and the command line (e.g. `round_robin`).
[[nodiscard]] constexpr auto schedule_policy_to_str(const SchedulePolicy policy) -> std::string_view
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 6,
      "Exhaustive handling of all variants for enum SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return "fcfs";
        }
        case SchedulePolicy::ShortestJobFirst: {
            return "sjf";
        }
        case SchedulePolicy::ShortestRemainingTimeFirst: {
            return "srtf";
        }
        case SchedulePolicy::PriorityNonPreemptive: {
            return "priority";
        }
        case SchedulePolicy::PriorityPreemptive: {
            return "priority_preemptive";
        }
        case SchedulePolicy::RoundRobin: {
            return "round_robin";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

[[nodiscard]] auto schedule_policy_try_from_str(std::string_view str) -> std::optional<SchedulePolicy>;

[[nodiscard]] constexpr auto schedule_policy_requires_priority(const SchedulePolicy policy) -> bool
{
    return policy == SchedulePolicy::PriorityNonPreemptive || policy == SchedulePolicy::PriorityPreemptive;
}

} // namespace Simulations
