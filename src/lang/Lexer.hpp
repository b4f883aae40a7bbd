#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <string_view>
#include <vector>

#include "Token.hpp"

namespace Interpreter
{

// Splits a workload script into tokens. Whitespace and `#` comments separate tokens and are dropped.
class [[nodiscard]] Lexer final
{
  public:
    [[nodiscard]] static auto lex(const std::string_view source) -> std::optional<std::vector<Token>>;

  private:
    explicit Lexer(const std::string_view source);

    [[nodiscard]] auto punctuation() -> std::optional<Token>;
    [[nodiscard]] auto keyword_or_identifier() -> std::optional<Token>;
    [[nodiscard]] auto string_literal() -> std::optional<Token>;
    [[nodiscard]] auto number() -> std::optional<Token>;
    [[nodiscard]] auto two_character_token(char c, TokenKind kind) -> std::optional<Token>;

    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto next_token() -> std::optional<Token>;
    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<char>;
    void               advance(const std::size_t amount = 1);
    void               skip_trivia();

    // Span from `start` (a location taken before the token was consumed) to the cursor
    [[nodiscard]] auto span_from(const Span& start) const -> Span;
    [[nodiscard]] auto location() const -> Span;

    template<typename... Args>
    static auto report_error(const Span& span, std::format_string<Args...> message, Args&&... args) -> std::nullopt_t;

  private:
    std::string_view source;
    std::size_t      cursor     = 0;
    std::size_t      line       = 1;
    std::size_t      line_start = 0;
};

} // namespace Interpreter
