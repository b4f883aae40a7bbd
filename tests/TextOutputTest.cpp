#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/TextOutput.hpp"
#include "simulations/Scheduler.hpp"

using Simulations::Schedule;
using Simulations::ScheduleEntry;

TEST(GanttChart, OneRowPerProcess)
{
    const Schedule schedule = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 3.0 },
        ScheduleEntry { .pid = "P2", .start_time = 3.0, .end_time = 4.0 },
        ScheduleEntry { .pid = "P3", .start_time = 4.0, .end_time = 6.0 },
    };

    EXPECT_EQ(
      Cli::gantt_chart(schedule),
      "P1   |###   |\n"
      "P2   |   #  |\n"
      "P3   |    ##|\n"
      "     0   6.00\n"
    );
}

TEST(GanttChart, IdleRowComesLast)
{
    const Schedule schedule = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 2.0 },
        ScheduleEntry { .pid = std::nullopt, .start_time = 2.0, .end_time = 5.0 },
        ScheduleEntry { .pid = "P2", .start_time = 5.0, .end_time = 8.0 },
    };

    EXPECT_EQ(
      Cli::gantt_chart(schedule),
      "P1   |##      |\n"
      "P2   |     ###|\n"
      "IDLE |  ...   |\n"
      "     0     8.00\n"
    );
}

TEST(GanttChart, PreemptedProcessSharesItsRow)
{
    const std::vector<Os::Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 1.0 }, { "P3", 2.0, 2.0 } };
    const auto                     result    = Simulations::shortest_remaining_time_first(processes);
    ASSERT_TRUE(result.has_value());

    const auto chart = Cli::gantt_chart(result->schedule);
    EXPECT_NE(chart.find("P1   |# ##  |\n"), std::string::npos);
    EXPECT_NE(chart.find("P2   | #    |\n"), std::string::npos);
}

TEST(GanttChart, WidePidsWidenTheLabelColumn)
{
    const Schedule schedule = {
        ScheduleEntry { .pid = "worker", .start_time = 0.0, .end_time = 2.0 },
    };

    EXPECT_EQ(Cli::gantt_chart(schedule), "worker |##|\n       0 2.00\n");
}

TEST(GanttChart, LongRunsAreScaledDown)
{
    const Schedule schedule = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 50.0 },
        ScheduleEntry { .pid = "P2", .start_time = 50.0, .end_time = 100.0 },
    };

    const auto chart = Cli::gantt_chart(schedule, 10);
    EXPECT_NE(chart.find("P1   |#####     |\n"), std::string::npos);
    EXPECT_NE(chart.find("P2   |     #####|\n"), std::string::npos);
}

TEST(GanttChart, EmptyScheduleDrawsNothing)
{
    EXPECT_TRUE(Cli::gantt_chart({}).empty());

    const Schedule schedule = { ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 1.0 } };
    EXPECT_TRUE(Cli::gantt_chart(schedule, 0).empty());
}

TEST(ScheduleListing, OneLinePerEntry)
{
    const Schedule schedule = {
        ScheduleEntry { .pid = "P1", .start_time = 0.0, .end_time = 2.0 },
        ScheduleEntry { .pid = std::nullopt, .start_time = 2.0, .end_time = 5.0 },
    };

    EXPECT_EQ(Cli::schedule_listing(schedule), "  P1: 0.00 - 2.00\n  IDLE: 2.00 - 5.00\n");
}

TEST(ProcessTable, ShowsMissingPriorityAsDash)
{
    const std::vector<Os::Process> processes = { { "P1", 0.0, 3.0, 2 }, { "P2", 1.5, 1.0 } };

    const auto table = Cli::process_table(processes);
    EXPECT_NE(table.find("PID"), std::string::npos);
    EXPECT_NE(table.find("P1               0.00       3.00          2\n"), std::string::npos);
    EXPECT_NE(table.find("P2               1.50       1.00          -\n"), std::string::npos);
}

TEST(MetricsTable, ListsAveragesAndPerProcessRows)
{
    const std::vector<Os::Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 2.0 } };
    const auto                     result    = Simulations::first_come_first_served(processes);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->metrics.has_value());

    const auto table = Cli::metrics_table(*result->metrics);
    EXPECT_NE(table.find("Average waiting time"), std::string::npos);
    EXPECT_NE(table.find("1.00\n"), std::string::npos);
    EXPECT_NE(table.find("100.00%"), std::string::npos);
    EXPECT_NE(table.find("Completion"), std::string::npos);
    EXPECT_NE(table.find("P2"), std::string::npos);
}

TEST(ComparisonTable, ReportsFailedPolicies)
{
    const std::vector<Os::Process> processes = { { "P1", 0.0, 3.0 } };
    const auto                     table     = Cli::comparison_table(Simulations::simulate_all(processes));

    EXPECT_NE(table.find("First-Come, First-Served (FCFS)"), std::string::npos);
    EXPECT_NE(table.find("Round Robin (Quantum: 2.0)"), std::string::npos);
    EXPECT_NE(table.find("Priority (Preemptive)"), std::string::npos);
    EXPECT_NE(table.find("error: missing priority: process P1 does not have a priority assigned"), std::string::npos);
}
