#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <print>
#include <span>
#include <string_view>
#include <vector>

#include "cli/TextOutput.hpp"
#include "lang/Interpreter.hpp"
#include "simulations/Comparison.hpp"
#include "simulations/Format.hpp"
#include "simulations/Report.hpp"
#include "simulations/Scheduler.hpp"
#include "simulations/Workload.hpp"
#include "Util.hpp"

struct [[nodiscard]] Options final
{
    std::optional<std::filesystem::path>       script;
    std::optional<Simulations::SchedulePolicy> policy;
    std::optional<double>                      quantum;
    std::optional<std::filesystem::path>       save_path;
    bool                                       compare = false;
    bool                                       bench   = false;
};

static void usage(const char* executable)
{
    std::println("usage: {} <workload.sl> [--policy <name>] [--quantum <q>] [--compare] [--save <file.met>]", executable);
    std::println("       {} --bench", executable);
    std::println("policies: fcfs, sjf, srtf, priority, priority_preemptive, round_robin");
}

[[nodiscard]] static auto parse_options(const std::span<const char*> args) -> std::optional<Options>
{
    Options options;

    for (std::size_t idx = 1; idx < args.size(); ++idx) {
        const auto arg = std::string_view { args[idx] };

        const auto value_of = [&](const std::string_view flag) -> std::optional<std::string_view> {
            if (idx + 1 >= args.size()) {
                std::println(stderr, "[ERROR] missing value for {}", flag);
                return std::nullopt;
            }
            return std::string_view { args[++idx] };
        };

        if (arg == "--bench") {
            options.bench = true;
        } else if (arg == "--compare") {
            options.compare = true;
        } else if (arg == "--policy") {
            const auto name   = TRY(value_of(arg));
            const auto policy = Simulations::schedule_policy_try_from_str(name);
            if (!policy) {
                std::println(stderr, "[ERROR] unknown schedule policy `{}`", name);
                return std::nullopt;
            }
            options.policy = policy;
        } else if (arg == "--quantum") {
            const auto value   = TRY(value_of(arg));
            const auto quantum = Util::parse_double(value);
            if (!quantum) {
                std::println(stderr, "[ERROR] time quantum is not a number: `{}`", value);
                return std::nullopt;
            }
            options.quantum = quantum;
        } else if (arg == "--save") {
            options.save_path = std::filesystem::path(TRY(value_of(arg)));
        } else if (arg.starts_with("--")) {
            std::println(stderr, "[ERROR] unknown option `{}`", arg);
            return std::nullopt;
        } else if (options.script) {
            std::println(stderr, "[ERROR] more than one workload script given: `{}`", arg);
            return std::nullopt;
        } else {
            options.script = std::filesystem::path(arg);
        }
    }

    if (!options.bench && !options.script) {
        std::println(stderr, "[ERROR] expected file path to workload script");
        return std::nullopt;
    }

    return options;
}

[[nodiscard]] static auto load_workload(const Options& options) -> std::shared_ptr<Simulations::Workload>
{
    const auto script_content = Util::read_entire_file(*options.script);
    if (!script_content) { return nullptr; }

    auto workload = std::make_shared<Simulations::Workload>();
    if (!Interpreter::Interpreter<Simulations::Workload>::eval(*script_content, workload)) {
        std::println(stderr, "[ERROR] Could not correctly evaluate script {}", options.script->string());
        return nullptr;
    }

    if (options.policy) { workload->schedule_policy = *options.policy; }
    if (options.quantum) { workload->time_quantum = *options.quantum; }

    return workload;
}

[[nodiscard]] static auto run_single(const Simulations::Workload& workload, const Options& options) -> int
{
    const auto result = workload.simulate();
    if (!result) {
        std::println(stderr, "[ERROR] {}", result.error());
        return 1;
    }

    std::println("{}\n", result->algorithm_name);
    std::print("{}", Cli::process_table(workload.processes));

    if (result->schedule.empty()) {
        std::println("\nNothing to schedule.");
    } else {
        std::println("\nSchedule:");
        std::print("{}", Cli::schedule_listing(result->schedule));
        std::println("\nGantt chart:");
        std::print("{}", Cli::gantt_chart(result->schedule));
    }

    if (result->metrics) {
        std::println("\nMetrics:");
        std::print("{}", Cli::metrics_table(*result->metrics));
    }

    if (options.save_path) {
        if (!Simulations::Report::save(*options.save_path, *result)) { return 1; }
        std::println("\n[INFO] Saved simulation result to {}", options.save_path->string());
    }

    return 0;
}

[[nodiscard]] static auto run_compare(const Simulations::Workload& workload) -> int
{
    std::print("{}", Cli::process_table(workload.processes));
    std::println("");

    const auto comparisons = Simulations::simulate_all(workload.processes, workload.time_quantum);
    std::print("{}", Cli::comparison_table(comparisons));

    const auto any_failed = std::ranges::any_of(comparisons, [](const auto& comparison) { return !comparison.result; });
    return any_failed ? 1 : 0;
}

struct [[nodiscard]] BenchCase final
{
    std::string_view            label;
    Simulations::SchedulePolicy policy;
    double                      quantum = Simulations::DEFAULT_TIME_QUANTUM;
};

[[nodiscard]] static auto run_bench() -> int
{
    constexpr static auto SIZES = { 10UZ, 50UZ, 100UZ, 500UZ, 1000UZ };
    constexpr static auto SEED  = 42U;

    using enum Simulations::SchedulePolicy;
    const auto cases = std::array {
        BenchCase { .label = "FCFS", .policy = FirstComeFirstServed },
        BenchCase { .label = "SJF Non-Preemptive", .policy = ShortestJobFirst },
        BenchCase { .label = "SJF Preemptive", .policy = ShortestRemainingTimeFirst },
        BenchCase { .label = "Priority Non-Preemptive", .policy = PriorityNonPreemptive },
        BenchCase { .label = "Priority Preemptive", .policy = PriorityPreemptive },
        BenchCase { .label = "Round Robin (Q=1)", .policy = RoundRobin, .quantum = 1.0 },
        BenchCase { .label = "Round Robin (Q=5)", .policy = RoundRobin, .quantum = 5.0 },
    };

    Simulations::Workload workload;
    workload.reseed(SEED);
    workload.min_burst_time = 0.1;
    workload.max_burst_time = 5.0;

    bool failed = false;
    std::println("{:<10} {:<25} {:>10} {:>10} {:>10} {:>8}", "Processes", "Algorithm", "Time (s)", "Avg Wait", "CPU Util%", "Entries");
    for (const auto size : SIZES) {
        workload.randomize(size, Simulations::Workload::BENCH_ARRIVAL_SPREAD);

        for (const auto& bench_case : cases) {
            const auto start   = std::chrono::steady_clock::now();
            const auto result  = Simulations::simulate(bench_case.policy, workload.processes, bench_case.quantum);
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

            if (!result) {
                std::println(stderr, "[ERROR] {} with {} processes: {}", bench_case.label, size, result.error());
                failed = true;
                continue;
            }

            const auto metrics = result->metrics.value_or(Simulations::Metrics {});
            std::println(
              "{:<10} {:<25} {:>10.4f} {:>10.2f} {:>10.2f} {:>8}",
              size,
              bench_case.label,
              elapsed.count(),
              metrics.average_waiting_time,
              metrics.cpu_utilization,
              result->schedule.size()
            );
        }
    }

    std::println("\nEdge cases:");
    const auto check = [&](const std::string_view label, const bool passed) {
        std::println("  [{}] {}", passed ? "ok" : "FAILED", label);
        failed |= !passed;
    };

    const auto empty = Simulations::first_come_first_served({});
    check("empty process list", empty.has_value() && empty->schedule.empty() && !empty->metrics.has_value());

    const std::vector<Os::Process> single = { { "P1", 0.0, 5.0, 1 } };
    const auto                     single_result = Simulations::first_come_first_served(single);
    check("single process", single_result.has_value() && single_result->metrics->total_processes == 1);

    const std::vector<Os::Process> same_arrival = { { "P1", 0.0, 3.0, 1 }, { "P2", 0.0, 2.0, 2 }, { "P3", 0.0, 4.0, 3 } };
    const auto                     same_result  = Simulations::first_come_first_served(same_arrival);
    check("simultaneous arrivals", same_result.has_value() && same_result->metrics->total_processes == 3);

    const std::vector<Os::Process> pair = { { "P1", 0.0, 10.0 }, { "P2", 0.0, 5.0 } };
    const auto                     short_quantum = Simulations::round_robin(pair, 0.1);
    check("very short time quantum", short_quantum.has_value() && short_quantum->schedule.size() > 10);

    const auto large_quantum = Simulations::round_robin(pair, 100.0);
    check("very large time quantum", large_quantum.has_value() && large_quantum->schedule.size() == 2);

    return failed ? 1 : 0;
}

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));

    const auto options = parse_options(args);
    if (!options) {
        usage(args[0]);
        return 1;
    }

    if (options->bench) { return run_bench(); }

    const auto workload = load_workload(*options);
    if (!workload) { return 1; }

    return options->compare ? run_compare(*workload) : run_single(*workload, *options);
}
