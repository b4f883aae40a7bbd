#pragma once

#include <optional>
#include <string>

namespace Os
{

struct [[nodiscard]] Process final
{
    std::string        pid;
    double             arrival_time = 0.0;
    double             burst_time   = 0.0;
    std::optional<int> priority     = std::nullopt;

    [[nodiscard]] auto has_priority() const -> bool { return priority.has_value(); }

    [[nodiscard]] auto operator==(const Process&) const -> bool = default;
};

} // namespace Os
