#include "Report.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <sstream>

#include "Util.hpp"

[[nodiscard]] static auto split_key_value(const std::string_view line)
  -> std::optional<std::pair<std::string_view, std::string_view>>
{
    const auto equals = line.find('=');
    if (equals == std::string_view::npos) { return std::nullopt; }

    return std::pair { Util::trim(line.substr(0, equals)), Util::trim(line.substr(equals + 1)) };
}

[[nodiscard]] static auto label_from_key(const std::string_view key) -> std::string
{
    return Util::capitalize(Util::wordify(std::string(key)));
}

namespace Simulations
{

auto Report::serialize(const SchedulingResult& result) -> std::string
{
    const auto metrics = result.metrics.value_or(Metrics {});

    std::stringstream ss;
    ss << std::format("algorithm = {}\n", result.algorithm_name);
    ss << std::format("total_processes = {}\n", metrics.total_processes);

    ss << SEPARATOR << '\n';

    ss << std::format("average_waiting_time = {:.2f}\n", metrics.average_waiting_time);
    ss << std::format("average_turnaround_time = {:.2f}\n", metrics.average_turnaround_time);
    ss << std::format("cpu_utilization = {:.2f}\n", metrics.cpu_utilization);
    ss << std::format("total_time = {:.2f}\n", metrics.total_time);

    return ss.str();
}

auto Report::save(const std::filesystem::path& file_path, const SchedulingResult& result) -> bool
{
    return Util::write_to_file(file_path, serialize(result));
}

auto Report::parse(const std::string_view content) -> std::optional<Report>
{
    Report      report;
    bool        in_metrics  = false;
    std::size_t line_number = 0;

    for (const auto& line_range : content | std::views::split('\n')) {
        ++line_number;

        const auto line = Util::trim(std::string_view { line_range.begin(), line_range.end() });
        if (line.empty()) { continue; }
        if (line == SEPARATOR) {
            in_metrics = true;
            continue;
        }

        const auto key_value = split_key_value(line);
        if (!key_value || key_value->first.empty()) {
            std::println(stderr, "[ERROR] (report) line {}: expected `key = value`, got `{}`", line_number, line);
            return std::nullopt;
        }

        const auto [key, value] = *key_value;
        if (!in_metrics) {
            report.header.emplace_back(label_from_key(key), std::string(value));
            continue;
        }

        const auto number = Util::parse_double(value);
        if (!number) {
            std::println(stderr, "[ERROR] (report) line {}: value of `{}` is not a number: `{}`", line_number, key, value);
            return std::nullopt;
        }
        report.metrics.emplace_back(label_from_key(key), *number);
    }

    if (!in_metrics) {
        std::println(stderr, "[ERROR] (report) missing `{}` line", SEPARATOR);
        return std::nullopt;
    }

    return report;
}

auto Report::load(const std::filesystem::path& file_path) -> std::optional<Report>
{
    const auto content = TRY(Util::read_entire_file(file_path));

    auto report = parse(content);
    if (!report) { std::println(stderr, "[NOTE] (report) while reading {}", file_path.string()); }

    return report;
}

auto Report::metric(const std::string_view label) const -> std::optional<double>
{
    const auto it = std::ranges::find(metrics, label, &std::pair<std::string, double>::first);
    if (it == metrics.end()) { return std::nullopt; }

    return it->second;
}

auto Report::group_metrics(const std::span<const Report> reports) -> std::optional<std::vector<MetricSeries>>
{
    std::vector<MetricSeries> result;
    if (reports.empty()) { return result; }

    for (const auto& entry : reports.front().metrics) {
        const auto&  label = entry.first;
        MetricSeries series { .label = label, .values = {} };
        for (std::size_t idx = 0; idx < reports.size(); ++idx) {
            const auto value = reports[idx].metric(label);
            if (!value) {
                std::println(stderr, "[ERROR] (report) report #{} has no `{}` metric", idx + 1, label);
                return std::nullopt;
            }
            series.values.push_back(*value);
        }
        result.push_back(std::move(series));
    }

    return result;
}

} // namespace Simulations
