#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "os/Process.hpp"
#include "simulations/Comparison.hpp"
#include "simulations/Schedule.hpp"

namespace Cli
{

constexpr static auto GANTT_MAX_COLUMNS = 80UZ;

[[nodiscard]] auto process_table(std::span<const Os::Process> processes) -> std::string;
[[nodiscard]] auto schedule_listing(const Simulations::Schedule& schedule) -> std::string;

// One row per process in order of first appearance plus an `IDLE` row when the CPU idles. The
// chart is min(max_columns, ceil(total_time)) columns wide, each covering an equal share of the run.
[[nodiscard]] auto gantt_chart(const Simulations::Schedule& schedule, std::size_t max_columns = GANTT_MAX_COLUMNS)
  -> std::string;

[[nodiscard]] auto metrics_table(const Simulations::Metrics& metrics) -> std::string;
[[nodiscard]] auto comparison_table(std::span<const Simulations::Comparison> comparisons) -> std::string;

} // namespace Cli
