#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "simulations/Schedule.hpp"

namespace Simulations
{

struct [[nodiscard]] MetricSeries final
{
    std::string         label;
    std::vector<double> values;
};

// `.met` result files: `key = value` lines, with a `separator` line between the descriptive
// header and the numeric metrics.
struct [[nodiscard]] Report final
{
    constexpr static auto SEPARATOR = "separator";

    // Display labels, e.g. `average_waiting_time` is read back as "Average Waiting Time"
    std::vector<std::pair<std::string, std::string>> header;
    std::vector<std::pair<std::string, double>>      metrics;

    [[nodiscard]] static auto serialize(const SchedulingResult& result) -> std::string;
    [[nodiscard]] static auto save(const std::filesystem::path& file_path, const SchedulingResult& result) -> bool;

    [[nodiscard]] static auto parse(std::string_view content) -> std::optional<Report>;
    [[nodiscard]] static auto load(const std::filesystem::path& file_path) -> std::optional<Report>;

    [[nodiscard]] auto metric(std::string_view label) const -> std::optional<double>;

    // One series per metric of the first report, holding that metric's value in every report.
    // Fails when a report lacks one of the metrics.
    [[nodiscard]] static auto group_metrics(std::span<const Report> reports) -> std::optional<std::vector<MetricSeries>>;
};

} // namespace Simulations
