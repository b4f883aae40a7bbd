#include <gtest/gtest.h>

#include <format>
#include <vector>

#include "simulations/Metrics.hpp"
#include "simulations/Scheduler.hpp"

using Os::Process;
using Simulations::ProcessMetrics;
using Simulations::Schedule;
using Simulations::ScheduleEntry;

TEST(RoundToHundredths, RoundsTheExactValueTiesToEven)
{
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(3.333333), 3.33);
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(2.666666), 2.67);
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(0.125), 0.12);
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(-0.125), -0.12);
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(0.375), 0.38);
    // 2.675 is stored as 2.67499999...
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(2.675), 2.67);
    EXPECT_DOUBLE_EQ(Simulations::round_to_hundredths(42.0), 42.0);
}

TEST(CalculateMetrics, AverageOnAnExactTieRoundsToEven)
{
    // Only P2 waits, for one unit: the mean waiting time is exactly 1/8
    std::vector<Process> processes = { { "P1", 0.0, 1.0 }, { "P2", 0.0, 1.0 } };
    for (int idx = 3; idx <= 8; ++idx) {
        processes.push_back(Process { std::format("P{}", idx), 10.0 * (idx - 2), 1.0 });
    }

    const auto result = Simulations::first_come_first_served(processes);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->metrics.has_value());

    EXPECT_DOUBLE_EQ(result->metrics->average_waiting_time, 0.12);
    EXPECT_DOUBLE_EQ(result->metrics->average_turnaround_time, 1.12);
}

TEST(CalculateMetrics, BackToBackProcesses)
{
    const std::vector<Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 2.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 3.0 },
        ScheduleEntry { .pid = "P2", .start_time = 3.0, .end_time = 5.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    EXPECT_DOUBLE_EQ(metrics.average_turnaround_time, 3.5);
    EXPECT_DOUBLE_EQ(metrics.average_waiting_time, 1.0);
    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 100.0);
    EXPECT_EQ(metrics.total_processes, 2U);
    EXPECT_DOUBLE_EQ(metrics.total_time, 5.0);

    const std::vector<ProcessMetrics> expected = {
        { .pid = "P1", .completion_time = 3.0, .turnaround_time = 3.0, .waiting_time = 0.0 },
        { .pid = "P2", .completion_time = 5.0, .turnaround_time = 4.0, .waiting_time = 2.0 },
    };
    EXPECT_EQ(metrics.per_process, expected);
}

TEST(CalculateMetrics, IdleTimeLowersUtilization)
{
    const std::vector<Process> processes = { { "P1", 0.0, 2.0 }, { "P2", 5.0, 3.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 2.0 },
        ScheduleEntry { .pid = std::nullopt, .start_time = 2.0, .end_time = 5.0 },
        ScheduleEntry { .pid = "P2", .start_time = 5.0, .end_time = 8.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 62.5);
    EXPECT_DOUBLE_EQ(metrics.total_time, 8.0);
    EXPECT_DOUBLE_EQ(metrics.average_waiting_time, 0.0);
    EXPECT_DOUBLE_EQ(metrics.average_turnaround_time, 2.5);
}

TEST(CalculateMetrics, CompletionIsTheLastSlice)
{
    const std::vector<Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 1.0 }, { "P3", 2.0, 2.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 1.0 },
        ScheduleEntry { .pid = "P2", .start_time = 1.0, .end_time = 2.0 },
        ScheduleEntry { .pid = "P1", .start_time = 2.0, .end_time = 4.0 },
        ScheduleEntry { .pid = "P3", .start_time = 4.0, .end_time = 6.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    ASSERT_EQ(metrics.per_process.size(), 3U);
    EXPECT_DOUBLE_EQ(metrics.per_process[0].completion_time, 4.0);
    EXPECT_DOUBLE_EQ(metrics.per_process[0].waiting_time, 1.0);
    EXPECT_DOUBLE_EQ(metrics.average_turnaround_time, 3.0);
    EXPECT_DOUBLE_EQ(metrics.average_waiting_time, 1.0);
}

TEST(CalculateMetrics, AveragesAreRoundedToTwoDecimals)
{
    const std::vector<Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 1.0 }, { "P3", 2.0, 2.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 3.0 },
        ScheduleEntry { .pid = "P2", .start_time = 3.0, .end_time = 4.0 },
        ScheduleEntry { .pid = "P3", .start_time = 4.0, .end_time = 6.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    EXPECT_DOUBLE_EQ(metrics.average_turnaround_time, 3.33);
    EXPECT_DOUBLE_EQ(metrics.average_waiting_time, 1.33);
}

TEST(CalculateMetrics, PerProcessFollowsInputOrder)
{
    const std::vector<Process> processes = { { "P2", 0.0, 3.0 }, { "P1", 0.0, 3.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 3.0 },
        ScheduleEntry { .pid = "P2", .start_time = 3.0, .end_time = 6.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    ASSERT_EQ(metrics.per_process.size(), 2U);
    EXPECT_EQ(metrics.per_process[0].pid, "P2");
    EXPECT_DOUBLE_EQ(metrics.per_process[0].waiting_time, 3.0);
    EXPECT_EQ(metrics.per_process[1].pid, "P1");
    EXPECT_DOUBLE_EQ(metrics.per_process[1].waiting_time, 0.0);
}

TEST(CalculateMetrics, UnscheduledProcessesOnlyCountTowardsTotal)
{
    const std::vector<Process> processes = { { "P1", 0.0, 2.0 }, { "P2", 1.0, 2.0 } };
    const Schedule             schedule  = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 2.0 },
    };

    const auto metrics = Simulations::calculate_metrics(processes, schedule);

    EXPECT_EQ(metrics.total_processes, 2U);
    ASSERT_EQ(metrics.per_process.size(), 1U);
    EXPECT_DOUBLE_EQ(metrics.average_turnaround_time, 2.0);
}

TEST(CalculateMetrics, EmptyScheduleHasNoUtilization)
{
    const std::vector<Process> processes = { { "P1", 0.0, 2.0 } };

    const auto metrics = Simulations::calculate_metrics(processes, {});

    EXPECT_DOUBLE_EQ(metrics.cpu_utilization, 0.0);
    EXPECT_DOUBLE_EQ(metrics.total_time, 0.0);
    EXPECT_DOUBLE_EQ(metrics.average_waiting_time, 0.0);
    EXPECT_TRUE(metrics.per_process.empty());
}
