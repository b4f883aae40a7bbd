#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <variant>

#include "Util.hpp"

TEST(Util, ParseDoubleAcceptsWholeStringOnly)
{
    EXPECT_EQ(Util::parse_double("2.5"), 2.5);
    EXPECT_EQ(Util::parse_double("10"), 10.0);
    EXPECT_EQ(Util::parse_double("-0.25"), -0.25);
    EXPECT_FALSE(Util::parse_double("2.5s").has_value());
    EXPECT_FALSE(Util::parse_double("").has_value());
    EXPECT_FALSE(Util::parse_double("fast").has_value());
}

TEST(Util, Trim)
{
    EXPECT_EQ(Util::trim("  key = value \t\n"), "key = value");
    EXPECT_EQ(Util::trim("   "), "");
    EXPECT_EQ(Util::trim("x"), "x");
}

TEST(Util, IsIntegral)
{
    EXPECT_TRUE(Util::is_integral(3.0));
    EXPECT_TRUE(Util::is_integral(-2.0));
    EXPECT_FALSE(Util::is_integral(1.5));
    EXPECT_TRUE(Util::is_integral(1e20));
    EXPECT_FALSE(Util::is_integral(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(Util::is_integral(std::numeric_limits<double>::quiet_NaN()));
}

TEST(Util, ToIntegralChecksRange)
{
    EXPECT_EQ(Util::to_integral<int>(42.0), 42);
    EXPECT_EQ(Util::to_integral<int>(-2147483648.0), std::numeric_limits<int>::min());
    EXPECT_EQ(Util::to_integral<int>(2147483647.0), std::numeric_limits<int>::max());
    EXPECT_FALSE(Util::to_integral<int>(2147483648.0).has_value());
    EXPECT_FALSE(Util::to_integral<int>(3e9).has_value());
    EXPECT_FALSE(Util::to_integral<int>(0.5).has_value());

    EXPECT_EQ(Util::to_integral<std::uint32_t>(4294967295.0), 4294967295U);
    EXPECT_FALSE(Util::to_integral<std::uint32_t>(-1.0).has_value());
    EXPECT_FALSE(Util::to_integral<std::uint32_t>(1e11).has_value());

    EXPECT_FALSE(Util::to_integral<std::size_t>(1e20).has_value());
}

TEST(Util, WordifyAndCapitalize)
{
    EXPECT_EQ(Util::wordify("average_waiting_time"), "average waiting time");
    EXPECT_EQ(Util::capitalize("average waiting time"), "Average Waiting Time");
    EXPECT_EQ(Util::capitalize(Util::wordify("cpu_utilization")), "Cpu Utilization");
    EXPECT_EQ(Util::capitalize(""), "");
}

TEST(Util, GetAlternative)
{
    const std::variant<std::string, double> number = 4.0;
    EXPECT_EQ(Util::get<double>(number), 4.0);
    EXPECT_FALSE(Util::get<std::string>(number).has_value());
}

TEST(Util, WriteThenReadFile)
{
    const auto path = std::filesystem::temp_directory_path() / "sim-sched-util-test.txt";
    ASSERT_TRUE(Util::write_to_file(path, "seed :: 1\n"));

    const auto content = Util::read_entire_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "seed :: 1\n");
}

TEST(Util, ReadingMissingFileFails)
{
    EXPECT_FALSE(Util::read_entire_file(std::filesystem::temp_directory_path() / "sim-sched-missing.sl").has_value());
    EXPECT_FALSE(Util::read_entire_file(std::filesystem::temp_directory_path()).has_value());
}
