#include <gtest/gtest.h>

#include <string>

#include "simulations/Workload.hpp"

using Simulations::Workload;

TEST(Workload, EmplaceAndContains)
{
    Workload workload;
    workload.emplace_process("A", 0.0, 2.0);
    workload.emplace_process("B", 1.0, 3.0, 4);

    EXPECT_TRUE(workload.contains("A"));
    EXPECT_TRUE(workload.contains("B"));
    EXPECT_FALSE(workload.contains("C"));
    EXPECT_EQ(workload.processes[1].priority, 4);
}

TEST(Workload, RandomProcessesTakeTheFirstFreePid)
{
    Workload workload;
    workload.reseed(1);
    workload.emplace_process("P1", 0.0, 1.0);
    workload.emplace_process("P3", 0.0, 1.0);

    EXPECT_EQ(workload.emplace_random_process().pid, "P2");
    EXPECT_EQ(workload.emplace_random_process().pid, "P4");
}

TEST(Workload, RandomProcessesRespectBounds)
{
    Workload workload;
    workload.reseed(3);
    workload.max_arrival_time = 5.0;
    workload.min_burst_time   = 0.5;
    workload.max_burst_time   = 2.0;
    workload.max_priority     = 3;

    for (int idx = 0; idx < 200; ++idx) {
        const auto& process = workload.emplace_random_process();
        EXPECT_GE(process.arrival_time, 0.0);
        EXPECT_LE(process.arrival_time, 5.0);
        EXPECT_GE(process.burst_time, 0.5);
        EXPECT_LE(process.burst_time, 2.0);
        ASSERT_TRUE(process.priority.has_value());
        EXPECT_GE(*process.priority, 1);
        EXPECT_LE(*process.priority, 3);
    }
}

TEST(Workload, RandomValuesHaveTwoDecimals)
{
    Workload workload;
    workload.reseed(11);

    for (int idx = 0; idx < 50; ++idx) {
        const auto& process = workload.emplace_random_process();
        EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(process.arrival_time), process.arrival_time);
        EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(process.burst_time), process.burst_time);
    }
}

TEST(Workload, RandomizeReplacesProcesses)
{
    Workload workload;
    workload.reseed(5);
    workload.emplace_process("old", 0.0, 1.0);

    workload.randomize(40, 0.5);

    ASSERT_EQ(workload.processes.size(), 40U);
    EXPECT_FALSE(workload.contains("old"));
    EXPECT_EQ(workload.processes.front().pid, "P1");
    EXPECT_EQ(workload.processes.back().pid, "P40");
    for (const auto& process : workload.processes) { EXPECT_LE(process.arrival_time, 20.0); }
}

TEST(Workload, SameSeedSameProcesses)
{
    Workload first;
    Workload second;
    first.reseed(99);
    second.reseed(99);

    first.randomize(25);
    second.randomize(25);

    EXPECT_EQ(first.processes, second.processes);
}

TEST(Workload, SimulatesWithItsConfiguration)
{
    Workload workload;
    workload.emplace_process("P1", 0.0, 3.0);
    workload.emplace_process("P2", 1.0, 1.0);
    workload.emplace_process("P3", 2.0, 2.0);
    workload.schedule_policy = Simulations::SchedulePolicy::RoundRobin;
    workload.time_quantum    = 2.0;

    const auto result = workload.simulate();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->algorithm_name, "Round Robin (Quantum: 2.0)");
    ASSERT_EQ(result->schedule.size(), 4U);
    EXPECT_DOUBLE_EQ(result->metrics->average_turnaround_time, 3.67);
    EXPECT_DOUBLE_EQ(result->metrics->average_waiting_time, 1.67);

    workload.time_quantum = 0.0;
    EXPECT_FALSE(workload.simulate().has_value());
}
