#pragma once

#include <cstddef>
#include <format>
#include <optional>
#include <vector>

#include "Ast.hpp"
#include "Token.hpp"

namespace Interpreter
{

// Recursive descent over the token stream:
//
//   statement  := for_loop | expression
//   for_loop   := `for` Number `..` Number `{` expression* `}`
//   expression := call | constant | StringLiteral | Number | Identifier
//   call       := Identifier `(` (expression (`,` expression)*)? `)`
//   constant   := Identifier `::` expression
class [[nodiscard]] Parser final
{
  public:
    [[nodiscard]] static auto parse(const std::vector<Token>& tokens) -> std::optional<Ast>;

  private:
    explicit Parser(const std::vector<Token>& tokens);

    [[nodiscard]] auto statement() -> std::optional<Statement>;
    [[nodiscard]] auto expression() -> std::optional<Expression>;
    [[nodiscard]] auto literal(TokenKind kind) -> std::optional<Expression>;
    [[nodiscard]] auto call(const Token& callee) -> std::optional<Expression>;
    [[nodiscard]] auto constant(const Token& name) -> std::optional<Expression>;
    [[nodiscard]] auto for_loop() -> std::optional<Expression>;
    [[nodiscard]] auto range() -> std::optional<Expression>;

    [[nodiscard]] auto expect(TokenKind expected) -> std::optional<Token>;
    [[nodiscard]] auto next_is(TokenKind kind, std::size_t offset = 0) const -> bool;
    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<Token>;
    [[nodiscard]] auto next() -> std::optional<Token>;

    auto push_expression(ExpressionKind kind, const Span& span) -> const Expression&;

    template<typename... Args>
    static auto report_error(const Span& span, std::format_string<Args...> message, Args&&... args) -> std::nullopt_t;

    template<typename... Args>
    static auto report_eof(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t;

  private:
    const std::vector<Token>& tokens;
    std::size_t               cursor = 0;

    Ast ast = {};
};

} // namespace Interpreter
