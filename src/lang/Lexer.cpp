#include "Lexer.hpp"

#include <cctype>
#include <print>

#include "Util.hpp"

[[nodiscard]] static auto is_digit(const char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

[[nodiscard]] static auto is_identifier_start(const char c) -> bool
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] static auto is_identifier_continuation(const char c) -> bool
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

namespace Interpreter
{

auto Lexer::lex(const std::string_view source) -> std::optional<std::vector<Token>>
{
    std::vector<Token> result = {};
    Lexer              lexer(source);

    lexer.skip_trivia();
    while (lexer.has_more()) {
        result.push_back(TRY(lexer.next_token()));
        lexer.skip_trivia();
    }

    return result;
}

Lexer::Lexer(const std::string_view source)
  : source { source }
{}

auto Lexer::punctuation() -> std::optional<Token>
{
    const auto start = location();
    const auto kind  = token_kind_try_from_punctuation(source[cursor]);
    assert(kind.has_value() && "caller checked for punctuation");

    advance();
    return Token { .lexeme = source.substr(start.start, 1), .kind = *kind, .span = span_from(start) };
}

auto Lexer::keyword_or_identifier() -> std::optional<Token>
{
    const auto start = location();
    if (!is_identifier_start(source[cursor])) {
        return report_error(start, "unexpected character `{}`", source[cursor]);
    }

    while (const auto c = peek()) {
        if (!is_identifier_continuation(*c)) { break; }
        advance();
    }

    const auto lexeme = source.substr(start.start, cursor - start.start);
    return Token {
        .lexeme = lexeme,
        .kind   = Token::is_reserved(lexeme) ? TokenKind::Keyword : TokenKind::Identifier,
        .span   = span_from(start),
    };
}

auto Lexer::string_literal() -> std::optional<Token>
{
    const auto opening = location();
    assert(peek() == '"' && "expected \"");
    advance();

    const auto content_start = cursor;
    while (true) {
        const auto c = peek();
        if (!c) { return report_error(opening, "unterminated string literal"); }
        if (*c == '"') { break; }
        advance();
    }

    const auto content_end = cursor;
    advance();

    return Token {
        .lexeme = source.substr(content_start, content_end - content_start),
        .kind   = TokenKind::StringLiteral,
        .span   = span_from(opening),
    };
}

auto Lexer::number() -> std::optional<Token>
{
    const auto start = location();
    assert(peek() && is_digit(*peek()) && "expected number");

    const auto skip_digits = [this] {
        while (const auto c = peek()) {
            if (!is_digit(*c)) { break; }
            advance();
        }
    };

    skip_digits();

    // `0..10` is a range, not the number `0.` followed by `.10`
    const auto dot   = peek();
    const auto digit = peek(1);
    if (dot == '.' && digit && is_digit(*digit)) {
        advance();
        skip_digits();
    }

    return Token {
        .lexeme = source.substr(start.start, cursor - start.start),
        .kind   = TokenKind::Number,
        .span   = span_from(start),
    };
}

auto Lexer::two_character_token(const char c, const TokenKind kind) -> std::optional<Token>
{
    const auto start = location();
    assert(peek() == c && "caller checked the first character");
    advance();

    if (peek() != c) { return report_error(start, "expected {}", kind); }
    advance();

    return Token { .lexeme = source.substr(start.start, 2), .kind = kind, .span = span_from(start) };
}

auto Lexer::has_more() const -> bool { return cursor < source.size(); }

auto Lexer::next_token() -> std::optional<Token>
{
    const auto c = TRY(peek());

    if (is_digit(c)) { return number(); }
    if (token_kind_try_from_punctuation(c)) { return punctuation(); }

    switch (c) {
        case ':': {
            return two_character_token(':', TokenKind::ColonColon);
        }
        case '.': {
            return two_character_token('.', TokenKind::DotDot);
        }
        case '"': {
            return string_literal();
        }
        default: {
            return keyword_or_identifier();
        }
    }
}

auto Lexer::peek(const std::size_t offset) const -> std::optional<char>
{
    if (cursor + offset >= source.size()) { return std::nullopt; }

    return source[cursor + offset];
}

void Lexer::advance(const std::size_t amount)
{
    for (std::size_t i = 0; i < amount && has_more(); ++i) {
        if (source[cursor] == '\n') {
            ++line;
            line_start = cursor + 1;
        }
        ++cursor;
    }
}

void Lexer::skip_trivia()
{
    while (const auto c = peek()) {
        if (*c == '#') {
            while (const auto commented = peek()) {
                if (*commented == '\n') { break; }
                advance();
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(*c)) == 0) { break; }
        advance();
    }
}

auto Lexer::span_from(const Span& start) const -> Span
{
    return Span { .start = start.start, .end = cursor, .line = start.line, .column = start.column };
}

auto Lexer::location() const -> Span
{
    return Span { .start = cursor, .end = cursor, .line = line, .column = cursor - line_start + 1 };
}

template<typename... Args>
auto Lexer::report_error(const Span& span, std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
{
    std::println(stderr, "[ERROR] (lexer) {}: {}", span, std::format(message, std::forward<Args>(args)...));
    return std::nullopt;
}

} // namespace Interpreter
