#include <gtest/gtest.h>

#include <memory>
#include <string_view>

#include "lang/Interpreter.hpp"
#include "simulations/Workload.hpp"

using Simulations::SchedulePolicy;
using Simulations::Workload;

namespace
{

auto eval(const std::string_view source, const std::shared_ptr<Workload>& workload) -> bool
{
    return Interpreter::Interpreter<Workload>::eval(source, workload);
}

auto eval_fresh(const std::string_view source) -> bool { return eval(source, std::make_shared<Workload>()); }

} // namespace

TEST(Interpreter, EmptyScriptLeavesDefaults)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval("# nothing to do\n", workload));

    EXPECT_TRUE(workload->processes.empty());
    EXPECT_EQ(workload->schedule_policy, SchedulePolicy::FirstComeFirstServed);
    EXPECT_DOUBLE_EQ(workload->time_quantum, Simulations::DEFAULT_TIME_QUANTUM);
}

TEST(Interpreter, ConfiguresPolicyAndProcesses)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval(
      R"(
schedule_policy :: round_robin
time_quantum :: 0.5

spawn_process("P1", 0, 2.5)
spawn_process("P2", 0.5, 1, 2)
spawn_process(P3, 4, 1.5)
)",
      workload
    ));

    EXPECT_EQ(workload->schedule_policy, SchedulePolicy::RoundRobin);
    EXPECT_DOUBLE_EQ(workload->time_quantum, 0.5);

    ASSERT_EQ(workload->processes.size(), 3U);
    EXPECT_EQ(workload->processes[0], (Os::Process { "P1", 0.0, 2.5 }));
    EXPECT_EQ(workload->processes[1], (Os::Process { "P2", 0.5, 1.0, 2 }));
    EXPECT_EQ(workload->processes[2].pid, "P3");
    EXPECT_FALSE(workload->processes[2].has_priority());
}

TEST(Interpreter, PolicyMayBeAStringLiteral)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval(R"(schedule_policy :: "priority_preemptive")", workload));
    EXPECT_EQ(workload->schedule_policy, SchedulePolicy::PriorityPreemptive);
}

TEST(Interpreter, EvaluatedWorkloadSchedules)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval(
      R"(
schedule_policy :: sjf
spawn_process("P1", 0, 8, 3)
spawn_process("P2", 1, 4, 1)
spawn_process("P3", 2, 9, 2)
spawn_process("P4", 3, 5, 4)
)",
      workload
    ));

    const auto result = workload->simulate();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->metrics.has_value());
    EXPECT_DOUBLE_EQ(result->metrics->average_waiting_time, 7.75);
    EXPECT_EQ(result->algorithm_name, "Shortest Job First (Non-Preemptive)");
}

TEST(Interpreter, ForLoopSpawnsRandomProcesses)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval(
      R"(
seed :: 42
max_arrival_time :: 20
min_burst_time :: 0.5
max_burst_time :: 6
max_priority :: 5

spawn_process("P2", 0, 1)
for 0..5 {
    spawn_random_process()
}
)",
      workload
    ));

    ASSERT_EQ(workload->processes.size(), 6U);
    EXPECT_EQ(workload->processes[1].pid, "P1");
    EXPECT_EQ(workload->processes[2].pid, "P3");
    EXPECT_EQ(workload->processes[5].pid, "P6");

    for (const auto& process : workload->processes) {
        EXPECT_GE(process.arrival_time, 0.0);
        EXPECT_LE(process.arrival_time, 20.0);
        EXPECT_GE(process.burst_time, 0.5);
        EXPECT_LE(process.burst_time, 6.0);
    }

    for (std::size_t idx = 1; idx < workload->processes.size(); ++idx) {
        const auto& priority = workload->processes[idx].priority;
        ASSERT_TRUE(priority.has_value());
        EXPECT_GE(*priority, 1);
        EXPECT_LE(*priority, 5);
    }
}

TEST(Interpreter, SeedMakesScriptsReproducible)
{
    constexpr auto script = "seed :: 7\nfor 0..10 { spawn_random_process() }";

    const auto first  = std::make_shared<Workload>();
    const auto second = std::make_shared<Workload>();
    ASSERT_TRUE(eval(script, first));
    ASSERT_TRUE(eval(script, second));

    EXPECT_EQ(first->processes, second->processes);
}

TEST(Interpreter, RejectsUnknownFunction)
{
    EXPECT_FALSE(eval_fresh(R"(spawn_thread("T1", 0, 1))"));
}

TEST(Interpreter, RejectsWrongArgumentCount)
{
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0))"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 1, 2, 3))"));
    EXPECT_FALSE(eval_fresh("spawn_random_process(1)"));
}

TEST(Interpreter, RejectsMismatchedArgumentTypes)
{
    EXPECT_FALSE(eval_fresh("spawn_process(1, 0, 1)"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", "0", 1))"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, fast))"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 1, high))"));
}

TEST(Interpreter, RejectsInvalidProcesses)
{
    EXPECT_FALSE(eval_fresh(R"(spawn_process("", 0, 1))"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 0))"));
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 1, 1.5))"));
}

TEST(Interpreter, RejectsDuplicatePid)
{
    const auto workload = std::make_shared<Workload>();
    EXPECT_FALSE(eval(R"(spawn_process("P1", 0, 1) spawn_process("P1", 2, 3))", workload));
    EXPECT_EQ(workload->processes.size(), 1U);
}

TEST(Interpreter, RejectsInvalidConstants)
{
    EXPECT_FALSE(eval_fresh("max_processes :: 10"));
    EXPECT_FALSE(eval_fresh("schedule_policy :: lottery"));
    EXPECT_FALSE(eval_fresh("schedule_policy :: 3"));
    EXPECT_FALSE(eval_fresh("time_quantum :: 0"));
    EXPECT_FALSE(eval_fresh("time_quantum :: fast"));
    EXPECT_FALSE(eval_fresh("min_burst_time :: 0"));
    EXPECT_FALSE(eval_fresh("max_priority :: 0"));
    EXPECT_FALSE(eval_fresh("max_priority :: 2.5"));
    EXPECT_FALSE(eval_fresh("seed :: 1.5"));
}

TEST(Interpreter, RejectsInvertedBurstBounds)
{
    EXPECT_FALSE(eval_fresh("min_burst_time :: 5\nmax_burst_time :: 2"));
    EXPECT_FALSE(eval_fresh("max_burst_time :: 0.5\nspawn_random_process()"));
}

TEST(Interpreter, RejectsFractionalRangeBounds)
{
    EXPECT_FALSE(eval_fresh("for 0..2.5 { spawn_random_process() }"));
}

TEST(Interpreter, RejectsNumbersOutOfIntegerRange)
{
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 1, 3000000000))"));
    EXPECT_FALSE(eval_fresh("max_priority :: 3000000000"));
    EXPECT_FALSE(eval_fresh("seed :: 99999999999"));
    EXPECT_FALSE(eval_fresh("for 0..99999999999999999999 { spawn_random_process() }"));
    EXPECT_FALSE(eval_fresh("for 0..200000 { }"));
}

TEST(Interpreter, AcceptsLargestRepresentableIntegers)
{
    const auto workload = std::make_shared<Workload>();
    ASSERT_TRUE(eval(R"(spawn_process("P1", 0, 1, 2147483647) seed :: 4294967295)", workload));
    ASSERT_EQ(workload->processes.size(), 1U);
    EXPECT_EQ(workload->processes[0].priority, 2147483647);
}

TEST(Interpreter, ReportsSyntaxErrors)
{
    EXPECT_FALSE(eval_fresh(R"(spawn_process("P1", 0, 1)"));
    EXPECT_FALSE(eval_fresh("seed : 1"));
}
