#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <concepts>
#include <filesystem>
#include <limits>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <string_view>
#include <variant>

#if __clang__ || __GNUC__
#define TRY(failable)                     \
    ({                                    \
        auto result = (failable);         \
        if (!result) return std::nullopt; \
        *result;                          \
    })
#else
#error "Unsupported compiler: TRY macro only supported for GCC and Clang"
#endif

namespace Util
{

[[nodiscard]] constexpr static auto trim(std::string_view sv) -> std::string_view
{
    const auto not_space = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    sv.remove_prefix(std::ranges::distance(sv.begin(), std::ranges::find_if(sv, not_space)));
    sv.remove_suffix(std::ranges::distance(sv.rbegin(), std::ranges::find_if(sv | std::views::reverse, not_space)));

    return sv;
}

template<typename... Lambdas>
struct [[nodiscard]] Visitor : public Lambdas...
{
    using Lambdas::operator()...;
};

template<typename... Lambdas>
[[nodiscard]] constexpr static auto make_visitor(Lambdas... lambdas) -> Visitor<Lambdas...>
{
    return Visitor { lambdas... };
}

template<typename Alternative>
[[nodiscard]] constexpr auto get(const auto& variant) -> std::optional<Alternative>
{
    if (const auto* value = std::get_if<Alternative>(&variant)) { return *value; }

    return std::nullopt;
}

[[nodiscard]] auto read_entire_file(const std::filesystem::path& file_path) -> std::optional<std::string>;
[[nodiscard]] auto write_to_file(const std::filesystem::path& file_path, const std::string& content) -> bool;

// Accepts the whole string only: "2.5" parses, "2.5s" does not.
[[nodiscard]] constexpr static auto parse_double(const std::string_view str) -> std::optional<double>
{
    double number        = 0.0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), number);
    if (ec != std::errc {} || ptr != str.data() + str.size()) { return std::nullopt; }

    return number;
}

[[nodiscard]] inline auto is_integral(const double value) -> bool
{
    return std::isfinite(value) && std::trunc(value) == value;
}

// Converts `value` when it is a whole number representable in `Integral`.
template<std::integral Integral>
[[nodiscard]] auto to_integral(const double value) -> std::optional<Integral>
{
    using Limits = std::numeric_limits<Integral>;

    // 2^digits, exact as a double even where Limits::max() is not
    const auto upper = static_cast<double>(Limits::max() / 2 + 1) * 2.0;
    if (!is_integral(value) || value < static_cast<double>(Limits::min()) || value >= upper) { return std::nullopt; }

    return static_cast<Integral>(value);
}

[[nodiscard]] constexpr static auto wordify(std::string str) -> std::string
{
    std::ranges::replace(str, '_', ' ');
    return str;
}

[[nodiscard]] constexpr static auto capitalize(std::string str) -> std::string
{
    for (auto word : str | std::views::split(' ')) {
        if (!word.empty()) {
            auto first = word.begin();
            *first     = static_cast<char>(std::toupper(static_cast<unsigned char>(*first)));
        }
    }

    return str;
}

} // namespace Util
