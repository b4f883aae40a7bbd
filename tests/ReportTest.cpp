#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

#include "simulations/Report.hpp"
#include "simulations/Scheduler.hpp"

using Simulations::Report;

namespace
{

auto simple_result() -> Simulations::SchedulingResult
{
    const std::vector<Os::Process> processes = { { "P1", 0.0, 3.0 }, { "P2", 1.0, 1.0 }, { "P3", 2.0, 2.0 } };
    return Simulations::first_come_first_served(processes).value();
}

} // namespace

TEST(Report, SerializesHeaderAndMetrics)
{
    const auto content = Report::serialize(simple_result());

    EXPECT_EQ(
      content,
      "algorithm = First-Come, First-Served (FCFS)\n"
      "total_processes = 3\n"
      "separator\n"
      "average_waiting_time = 1.33\n"
      "average_turnaround_time = 3.33\n"
      "cpu_utilization = 100.00\n"
      "total_time = 6.00\n"
    );
}

TEST(Report, SerializesEmptyResultWithZeroes)
{
    const auto result = Simulations::round_robin({}, 0.5);
    ASSERT_TRUE(result.has_value());

    const auto content = Report::serialize(*result);
    EXPECT_NE(content.find("algorithm = Round Robin (Quantum: 0.5)\n"), std::string::npos);
    EXPECT_NE(content.find("total_processes = 0\n"), std::string::npos);
    EXPECT_NE(content.find("cpu_utilization = 0.00\n"), std::string::npos);
}

TEST(Report, ParsesSerializedReport)
{
    const auto report = Report::parse(Report::serialize(simple_result()));
    ASSERT_TRUE(report.has_value());

    ASSERT_EQ(report->header.size(), 2U);
    EXPECT_EQ(report->header[0].first, "Algorithm");
    EXPECT_EQ(report->header[0].second, "First-Come, First-Served (FCFS)");
    EXPECT_EQ(report->header[1].first, "Total Processes");
    EXPECT_EQ(report->header[1].second, "3");

    ASSERT_EQ(report->metrics.size(), 4U);
    EXPECT_EQ(report->metrics[0].first, "Average Waiting Time");
    EXPECT_EQ(report->metric("Average Waiting Time"), 1.33);
    EXPECT_EQ(report->metric("Average Turnaround Time"), 3.33);
    EXPECT_EQ(report->metric("Cpu Utilization"), 100.0);
    EXPECT_EQ(report->metric("Total Time"), 6.0);
    EXPECT_FALSE(report->metric("Throughput").has_value());
}

TEST(Report, ToleratesBlankLinesAndPadding)
{
    const auto report = Report::parse("\n  algorithm =  FCFS  \n\nseparator\n  total_time=12.5\n\n");
    ASSERT_TRUE(report.has_value());

    ASSERT_EQ(report->header.size(), 1U);
    EXPECT_EQ(report->header[0].second, "FCFS");
    EXPECT_EQ(report->metric("Total Time"), 12.5);
}

TEST(Report, RejectsMissingSeparator)
{
    EXPECT_FALSE(Report::parse("algorithm = FCFS\ntotal_time = 3\n").has_value());
}

TEST(Report, RejectsLineWithoutValue)
{
    EXPECT_FALSE(Report::parse("algorithm FCFS\nseparator\n").has_value());
    EXPECT_FALSE(Report::parse("separator\n= 3\n").has_value());
}

TEST(Report, RejectsNonNumericMetric)
{
    EXPECT_FALSE(Report::parse("algorithm = FCFS\nseparator\ntotal_time = soon\n").has_value());
    EXPECT_FALSE(Report::parse("separator\ntotal_time = 3s\n").has_value());
}

TEST(Report, SavesAndLoads)
{
    const auto path = std::filesystem::temp_directory_path() / "sim-sched-report-test.met";
    ASSERT_TRUE(Report::save(path, simple_result()));

    const auto report = Report::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->metric("Total Time"), 6.0);
}

TEST(Report, LoadFailsForMissingFile)
{
    EXPECT_FALSE(Report::load(std::filesystem::temp_directory_path() / "sim-sched-no-such-report.met").has_value());
}

TEST(Report, GroupsMetricsAcrossReports)
{
    const auto first  = Report::parse("separator\naverage_waiting_time = 1.5\ntotal_time = 10\n");
    const auto second = Report::parse("separator\ntotal_time = 12\naverage_waiting_time = 2.25\n");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    const std::vector<Report> reports = { *first, *second };
    const auto                series  = Report::group_metrics(reports);
    ASSERT_TRUE(series.has_value());
    ASSERT_EQ(series->size(), 2U);

    EXPECT_EQ((*series)[0].label, "Average Waiting Time");
    EXPECT_EQ((*series)[0].values, (std::vector { 1.5, 2.25 }));
    EXPECT_EQ((*series)[1].label, "Total Time");
    EXPECT_EQ((*series)[1].values, (std::vector { 10.0, 12.0 }));
}

TEST(Report, GroupingFailsOnMissingMetric)
{
    const auto first  = Report::parse("separator\naverage_waiting_time = 1.5\ntotal_time = 10\n");
    const auto second = Report::parse("separator\ntotal_time = 12\n");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    const std::vector<Report> reports = { *first, *second };
    EXPECT_FALSE(Report::group_metrics(reports).has_value());
}

TEST(Report, GroupingNoReportsYieldsNoSeries)
{
    const auto series = Report::group_metrics({});
    ASSERT_TRUE(series.has_value());
    EXPECT_TRUE(series->empty());
}
