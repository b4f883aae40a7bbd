#include "Parser.hpp"

#include <cassert>
#include <print>
#include <utility>

#include "Util.hpp"

namespace Interpreter
{

auto Parser::parse(const std::vector<Token>& tokens) -> std::optional<Ast>
{
    Parser parser(tokens);

    while (parser.has_more()) {
        const auto statement = TRY(parser.statement());
        parser.ast.emplace_statement(statement);
    }

    return std::move(parser.ast);
}

Parser::Parser(const std::vector<Token>& tokens)
  : tokens { tokens }
{}

auto Parser::statement() -> std::optional<Statement>
{
    const auto root = TRY(expression());
    return Statement { .kind = root.id, .span = root.span, .id = ast.statements.size() };
}

auto Parser::expression() -> std::optional<Expression>
{
    const auto maybe_token = peek();
    if (!maybe_token) { return report_eof("expected expression"); }

    const auto token = *maybe_token;
    if (token.is_keyword("for")) { return for_loop(); }

    switch (token.kind) {
        case TokenKind::Identifier: {
            if (next_is(TokenKind::LeftParen, 1)) { return call(*next()); }
            if (next_is(TokenKind::ColonColon, 1)) { return constant(*next()); }

            return literal(TokenKind::Identifier);
        }
        case TokenKind::StringLiteral:
        case TokenKind::Number: {
            return literal(token.kind);
        }
        default: {
            return report_error(token.span, "expected expression but got {} `{}`", token.kind, token.lexeme);
        }
    }
}

auto Parser::literal(const TokenKind kind) -> std::optional<Expression>
{
    const auto token = TRY(expect(kind));

    switch (kind) {
        case TokenKind::StringLiteral: {
            return push_expression(StringLiteral { .literal = token }, token.span);
        }
        case TokenKind::Number: {
            return push_expression(Number { .number = token }, token.span);
        }
        case TokenKind::Identifier: {
            return push_expression(Variable { .name = token }, token.span);
        }
        default: {
            assert(false && "unreachable");
            return std::nullopt;
        }
    }
}

auto Parser::call(const Token& callee) -> std::optional<Expression>
{
    TRY(expect(TokenKind::LeftParen));

    std::vector<ExpressionId> arguments;
    while (!next_is(TokenKind::RightParen)) {
        if (!arguments.empty()) { TRY(expect(TokenKind::Comma)); }

        const auto argument = TRY(expression());
        arguments.push_back(argument.id);
    }

    const auto right_paren = TRY(expect(TokenKind::RightParen));
    return push_expression(
      Call { .identifier = callee, .arguments = std::move(arguments) }, Span::join(callee.span, right_paren.span)
    );
}

auto Parser::constant(const Token& name) -> std::optional<Expression>
{
    TRY(expect(TokenKind::ColonColon));

    const auto value = TRY(expression());
    return push_expression(Constant { .name = name, .value = value.id }, Span::join(name.span, value.span));
}

auto Parser::for_loop() -> std::optional<Expression>
{
    const auto for_token = TRY(next());
    const auto loop_range = TRY(range());

    TRY(expect(TokenKind::LeftCurly));

    std::vector<ExpressionId> body;
    while (!next_is(TokenKind::RightCurly)) {
        if (!has_more()) { return report_error(for_token.span, "unterminated `for` body, expected {}", TokenKind::RightCurly); }

        const auto expr = TRY(expression());
        body.push_back(expr.id);
    }

    const auto right_curly = TRY(expect(TokenKind::RightCurly));
    return push_expression(
      For { .range = loop_range.id, .body = std::move(body) }, Span::join(for_token.span, right_curly.span)
    );
}

auto Parser::range() -> std::optional<Expression>
{
    const auto start = TRY(expect(TokenKind::Number));
    TRY(expect(TokenKind::DotDot));
    const auto end = TRY(expect(TokenKind::Number));

    return push_expression(Range { .start = start, .end = end }, Span::join(start.span, end.span));
}

auto Parser::expect(const TokenKind expected) -> std::optional<Token>
{
    const auto maybe_token = next();
    if (!maybe_token) { return report_eof("expected {}", expected); }

    const auto token = *maybe_token;
    if (token.kind != expected) {
        return report_error(token.span, "expected {} but got {} `{}`", expected, token.kind, token.lexeme);
    }

    return token;
}

auto Parser::next_is(const TokenKind kind, const std::size_t offset) const -> bool
{
    const auto token = peek(offset);
    return token && token->kind == kind;
}

auto Parser::has_more() const -> bool { return cursor < tokens.size(); }

auto Parser::peek(const std::size_t offset) const -> std::optional<Token>
{
    if (cursor + offset < tokens.size()) { return tokens[cursor + offset]; }

    return std::nullopt;
}

auto Parser::next() -> std::optional<Token>
{
    if (has_more()) { return tokens[cursor++]; }

    return std::nullopt;
}

auto Parser::push_expression(ExpressionKind kind, const Span& span) -> const Expression&
{
    const auto id = ast.expressions.size();
    return ast.emplace_expression(std::move(kind), span, id);
}

template<typename... Args>
auto Parser::report_error(const Span& span, std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
{
    std::println(stderr, "[ERROR] (parser) {}: {}", span, std::format(message, std::forward<Args>(args)...));
    return std::nullopt;
}

template<typename... Args>
auto Parser::report_eof(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
{
    std::println(
      stderr, "[ERROR] (parser) unexpected end of script: {}", std::format(message, std::forward<Args>(args)...)
    );
    return std::nullopt;
}

} // namespace Interpreter
