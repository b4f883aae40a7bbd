#pragma once

#include <cstddef>
#include <format>

namespace Interpreter
{

// Byte range [start, end) of a script, located by the line and column of its first character.
struct [[nodiscard]] Span final
{
    [[nodiscard]] static auto join(const Span& first, const Span& last) -> Span
    {
        return Span { .start = first.start, .end = last.end, .line = first.line, .column = first.column };
    }

    std::size_t start  = 0;
    std::size_t end    = 0;
    std::size_t line   = 1;
    std::size_t column = 1;
};

} // namespace Interpreter

// `line:column`, the location prefix of every script diagnostic
template<>
struct std::formatter<Interpreter::Span>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Span& span, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}:{}", span.line, span.column);
    }
};
