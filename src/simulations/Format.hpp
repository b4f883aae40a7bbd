#pragma once

#include <cassert>
#include <format>
#include <utility>

#include "os/Process.hpp"
#include "simulations/Schedule.hpp"
#include "simulations/Scheduler.hpp"

template<>
struct std::formatter<Os::Process>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Os::Process& process, auto& ctx) const
    {
        if (process.priority) {
            return std::format_to(
              ctx.out(),
              "Process {{ pid = {}, arrival = {}, burst = {}, priority = {} }}",
              process.pid,
              process.arrival_time,
              process.burst_time,
              *process.priority
            );
        }

        return std::format_to(
          ctx.out(),
          "Process {{ pid = {}, arrival = {}, burst = {} }}",
          process.pid,
          process.arrival_time,
          process.burst_time
        );
    }
};

template<>
struct std::formatter<Simulations::ScheduleEntry>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Simulations::ScheduleEntry& entry, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{}: {:.2f} - {:.2f}", entry.pid.value_or("IDLE"), entry.start_time, entry.end_time
        );
    }
};

template<>
struct std::formatter<Simulations::SchedulePolicy>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::SchedulePolicy policy, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Simulations::schedule_policy_name(policy));
    }
};

template<>
struct std::formatter<Simulations::SchedulingErrorKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Simulations::SchedulingErrorKind kind, auto& ctx) const
    {
        const auto kind_to_str = [](Simulations::SchedulingErrorKind kind) {
            static_assert(
              std::to_underlying(Simulations::SchedulingErrorKind::Count) == 2,
              "Exhaustive handling of all enum variants for Simulations::SchedulingErrorKind is required."
            );
            switch (kind) {
                case Simulations::SchedulingErrorKind::MissingPriority: {
                    return "missing priority";
                }
                case Simulations::SchedulingErrorKind::InvalidTimeQuantum: {
                    return "invalid time quantum";
                }
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", kind_to_str(kind));
    }
};

template<>
struct std::formatter<Simulations::SchedulingError>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Simulations::SchedulingError& error, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}: {}", error.kind, error.message);
    }
};
