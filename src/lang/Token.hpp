#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

#include "Span.hpp"

namespace Interpreter
{

enum class [[nodiscard]] TokenKind : std::uint8_t
{
    // `(` `)` `{` `}` `,`
    LeftParen = 0,
    RightParen,
    LeftCurly,
    RightCurly,
    Comma,

    Keyword,
    Identifier,
    StringLiteral,
    Number,
    ColonColon,
    DotDot,
    Count,
};

// How a token kind reads in diagnostics, e.g. "expected `)` but got number".
[[nodiscard]] constexpr auto token_kind_to_str(const TokenKind kind) -> std::string_view
{
    static_assert(
      std::to_underlying(TokenKind::Count) == 11, "Exhaustive handling of all enum variants for TokenKind is required."
    );

    switch (kind) {
        case TokenKind::LeftParen: {
            return "`(`";
        }
        case TokenKind::RightParen: {
            return "`)`";
        }
        case TokenKind::LeftCurly: {
            return "`{`";
        }
        case TokenKind::RightCurly: {
            return "`}`";
        }
        case TokenKind::Comma: {
            return "`,`";
        }
        case TokenKind::Keyword: {
            return "keyword";
        }
        case TokenKind::Identifier: {
            return "identifier";
        }
        case TokenKind::StringLiteral: {
            return "string literal";
        }
        case TokenKind::Number: {
            return "number";
        }
        case TokenKind::ColonColon: {
            return "`::`";
        }
        case TokenKind::DotDot: {
            return "`..`";
        }
        default: {
            assert(false && "unreachable");
            return "unreachable";
        }
    }
}

[[nodiscard]] constexpr auto token_kind_try_from_punctuation(const char c) -> std::optional<TokenKind>
{
    switch (c) {
        case '(': {
            return TokenKind::LeftParen;
        }
        case ')': {
            return TokenKind::RightParen;
        }
        case '{': {
            return TokenKind::LeftCurly;
        }
        case '}': {
            return TokenKind::RightCurly;
        }
        case ',': {
            return TokenKind::Comma;
        }
        default: {
            return std::nullopt;
        }
    }
}

struct [[nodiscard]] Token final
{
    [[nodiscard]] constexpr static auto is_reserved(const std::string_view lexeme) -> bool
    {
        constexpr static std::string_view keywords[] = { "for" };
        return std::ranges::contains(keywords, lexeme);
    }

    [[nodiscard]] auto is_keyword(const std::string_view keyword) const -> bool
    {
        return kind == TokenKind::Keyword && lexeme == keyword;
    }

    // String literals exclude the surrounding quotes
    std::string_view lexeme;
    TokenKind        kind;
    Span             span;
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::TokenKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Interpreter::TokenKind kind, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{}", Interpreter::token_kind_to_str(kind));
    }
};

template<>
struct std::formatter<Interpreter::Token>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Token& token, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{} {} `{}`", token.span, token.kind, token.lexeme);
    }
};
