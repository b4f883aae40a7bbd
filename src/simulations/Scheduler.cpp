#include "Scheduler.hpp"

#include <charconv>
#include <deque>
#include <functional>
#include <queue>
#include <tuple>

namespace
{

using Simulations::Job;
using Simulations::Simulation;

// Ordering key of a job under a policy; ties between equal keys always go to the smaller pid.
using KeyFn = std::function<double(const Job&)>;

[[nodiscard]] auto precedes(const Job& lhs, const Job& rhs, const KeyFn& key) -> bool
{
    const auto lhs_key = key(lhs);
    const auto rhs_key = key(rhs);
    return std::tie(lhs_key, lhs.process.pid) < std::tie(rhs_key, rhs.process.pid);
}

[[nodiscard]] auto burst_time_key(const Job& job) -> double { return job.process.burst_time; }

[[nodiscard]] auto remaining_time_key(const Job& job) -> double { return job.remaining_time; }

[[nodiscard]] auto priority_key(const Job& job) -> double
{
    assert(job.process.priority.has_value() && "priorities are validated before scheduling");
    return static_cast<double>(*job.process.priority);
}

// Picks the best arrived job, runs it to completion, and idles to the earliest pending arrival
// when nothing has arrived yet.
void run_to_completion_by(Simulation& sim, const KeyFn& key)
{
    const auto job_count = sim.jobs.size();
    std::vector<bool> done(job_count, false);

    while (!sim.complete()) {
        std::optional<std::size_t> selected;
        for (std::size_t idx = 0; idx < job_count; ++idx) {
            const auto& job = sim.jobs[idx];
            if (done[idx] || job.process.arrival_time > sim.timer) { continue; }
            if (!selected || precedes(job, sim.jobs[*selected], key)) { selected = idx; }
        }

        if (!selected) {
            // jobs are in arrival order, so the first pending one arrives next
            const auto next = std::ranges::find(done, false) - done.begin();
            sim.idle_until(sim.jobs[static_cast<std::size_t>(next)].process.arrival_time);
            continue;
        }

        sim.run(*selected, sim.jobs[*selected].remaining_time);
        done[*selected] = true;
    }
}

// Fixed-step preemption: every PREEMPTION_STEP the running job competes with the ready set and
// yields only to a job that strictly precedes it.
void run_preemptive_by(Simulation& sim, const KeyFn& key)
{
    const auto job_count = sim.jobs.size();

    // the ready set only holds jobs that are not running, so their keys are stable while queued
    const auto comparator = [&](const std::size_t lhs, const std::size_t rhs) {
        return precedes(sim.jobs[rhs], sim.jobs[lhs], key);
    };
    std::priority_queue<std::size_t, std::vector<std::size_t>, decltype(comparator)> ready(comparator);

    std::size_t                next_arrival = 0;
    std::optional<std::size_t> running;

    while (!sim.complete()) {
        while (next_arrival < job_count && sim.jobs[next_arrival].process.arrival_time <= sim.timer) {
            ready.push(next_arrival++);
        }

        if (!ready.empty() && (!running || precedes(sim.jobs[ready.top()], sim.jobs[*running], key))) {
            const auto candidate = ready.top();
            ready.pop();
            if (running) { ready.push(*running); }
            running = candidate;
        }

        if (!running) {
            assert(next_arrival < job_count && "idle with no pending arrivals");
            sim.idle_until(sim.jobs[next_arrival].process.arrival_time);
            continue;
        }

        sim.run(*running, Simulations::PREEMPTION_STEP);
        if (sim.jobs[*running].complete()) { running.reset(); }
    }
}

// Shortest round-trip rendering of the quantum, always with a fractional part: 2 -> "2.0".
[[nodiscard]] auto quantum_label(const double quantum) -> std::string
{
    std::array<char, 64> buffer {};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), quantum);
    if (ec != std::errc {}) { return "?"; }

    auto label = std::string(buffer.data(), ptr);
    if (label.find_first_of(".en") == std::string::npos) { label += ".0"; }
    return label;
}

} // namespace

namespace Simulations
{

Simulation::Simulation(const std::span<const Os::Process> processes)
{
    jobs.reserve(processes.size());
    for (const auto& process : processes) { jobs.emplace_back(process); }

    std::ranges::sort(jobs, [](const Job& lhs, const Job& rhs) {
        return std::tie(lhs.process.arrival_time, lhs.process.pid)
               < std::tie(rhs.process.arrival_time, rhs.process.pid);
    });
}

void Simulation::idle_until(const double time)
{
    if (timer >= time) { return; }

    record(schedule, std::nullopt, timer, time);
    timer = time;
}

void Simulation::run(const std::size_t job_idx, const double slice)
{
    auto& job = jobs[job_idx];
    assert(!job.complete() && "job already finished");

    const auto start = timer;
    timer += job.execute(slice);
    record(schedule, job.process.pid, start, timer);

    if (job.complete()) { ++finished; }
}

auto validate_priorities(const std::span<const Os::Process> processes) -> std::optional<SchedulingError>
{
    const auto missing = std::ranges::find_if(processes, [](const auto& process) { return !process.has_priority(); });
    if (missing == processes.end()) { return std::nullopt; }

    return SchedulingError {
        .kind    = SchedulingErrorKind::MissingPriority,
        .message = "process " + missing->pid + " does not have a priority assigned",
    };
}

void FirstComeFirstServedPolicy::operator()(Simulation& sim) const
{
    for (std::size_t idx = 0; idx < sim.jobs.size(); ++idx) {
        sim.idle_until(sim.jobs[idx].process.arrival_time);
        sim.run(idx, sim.jobs[idx].remaining_time);
    }
}

void ShortestJobFirstPolicy::operator()(Simulation& sim) const { run_to_completion_by(sim, burst_time_key); }

void ShortestRemainingTimeFirstPolicy::operator()(Simulation& sim) const
{
    run_preemptive_by(sim, remaining_time_key);
}

void PriorityPolicy::operator()(Simulation& sim) const { run_to_completion_by(sim, priority_key); }

void PreemptivePriorityPolicy::operator()(Simulation& sim) const { run_preemptive_by(sim, priority_key); }

auto RoundRobinPolicy::name() const -> std::string
{
    return std::string(POLICY_NAME) + " (Quantum: " + quantum_label(quantum) + ")";
}

auto RoundRobinPolicy::validate(std::span<const Os::Process>) const -> std::optional<SchedulingError>
{
    if (quantum > 0.0) { return std::nullopt; }

    return SchedulingError {
        .kind    = SchedulingErrorKind::InvalidTimeQuantum,
        .message = "time quantum must be positive, got " + quantum_label(quantum),
    };
}

void RoundRobinPolicy::operator()(Simulation& sim) const
{
    const auto job_count = sim.jobs.size();

    std::deque<std::size_t> ready;
    std::size_t             next_arrival = 0;

    const auto admit_arrived = [&] {
        while (next_arrival < job_count && sim.jobs[next_arrival].process.arrival_time <= sim.timer) {
            ready.push_back(next_arrival++);
        }
    };

    admit_arrived();
    while (!sim.complete()) {
        if (ready.empty()) {
            assert(next_arrival < job_count && "idle with no pending arrivals");
            sim.idle_until(sim.jobs[next_arrival].process.arrival_time);
            admit_arrived();
        }

        const auto current = ready.front();
        ready.pop_front();

        sim.run(current, quantum);

        // arrivals during the slice queue up ahead of the preempted job
        admit_arrived();
        if (!sim.jobs[current].complete()) { ready.push_back(current); }
    }
}

auto first_come_first_served(const std::span<const Os::Process> processes) -> Result
{
    return run(processes, FirstComeFirstServedPolicy {});
}

auto shortest_job_first(const std::span<const Os::Process> processes) -> Result
{
    return run(processes, ShortestJobFirstPolicy {});
}

auto shortest_remaining_time_first(const std::span<const Os::Process> processes) -> Result
{
    return run(processes, ShortestRemainingTimeFirstPolicy {});
}

auto priority_non_preemptive(const std::span<const Os::Process> processes) -> Result
{
    return run(processes, PriorityPolicy {});
}

auto priority_preemptive(const std::span<const Os::Process> processes) -> Result
{
    return run(processes, PreemptivePriorityPolicy {});
}

auto round_robin(const std::span<const Os::Process> processes, const double time_quantum) -> Result
{
    return run(processes, RoundRobinPolicy { .quantum = time_quantum });
}

auto simulate(const SchedulePolicy policy, const std::span<const Os::Process> processes, const double time_quantum)
  -> Result
{
    static_assert(
      std::to_underlying(SchedulePolicy::Count) == 6,
      "Exhaustive handling of all variants for enum SchedulePolicy is required."
    );

    switch (policy) {
        case SchedulePolicy::FirstComeFirstServed: {
            return first_come_first_served(processes);
        }
        case SchedulePolicy::ShortestJobFirst: {
            return shortest_job_first(processes);
        }
        case SchedulePolicy::ShortestRemainingTimeFirst: {
            return shortest_remaining_time_first(processes);
        }
        case SchedulePolicy::PriorityNonPreemptive: {
            return priority_non_preemptive(processes);
        }
        case SchedulePolicy::PriorityPreemptive: {
            return priority_preemptive(processes);
        }
        case SchedulePolicy::RoundRobin: {
            return round_robin(processes, time_quantum);
        }
        default: {
            assert(false && "unreachable");
            return first_come_first_served(processes);
        }
    }
}

auto schedule_policy_try_from_str(const std::string_view str) -> std::optional<SchedulePolicy>
{
    const auto it = std::ranges::find(ALL_SCHEDULE_POLICIES, str, schedule_policy_to_str);
    if (it == ALL_SCHEDULE_POLICIES.end()) { return std::nullopt; }

    return *it;
}

} // namespace Simulations
