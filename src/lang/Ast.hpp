#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "Span.hpp"
#include "Token.hpp"
#include "Util.hpp"

namespace Interpreter
{

// Index into Ast::expressions
using ExpressionId  = std::size_t;
using StatementKind = std::variant<ExpressionId>;

// `spawn_process("P1", 0, 3)`
struct [[nodiscard]] Call final
{
    Token                     identifier;
    std::vector<ExpressionId> arguments;
};

struct [[nodiscard]] StringLiteral final
{
    Token literal;
};

struct [[nodiscard]] Number final
{
    Token number;
};

// A bare identifier, evaluated as its own name: `schedule_policy :: srtf`
struct [[nodiscard]] Variable final
{
    Token name;
};

// `name :: value`
struct [[nodiscard]] Constant final
{
    Token        name;
    ExpressionId value;
};

// `start..end`, end excluded
struct [[nodiscard]] Range final
{
    Token start;
    Token end;
};

// `for start..end { body }`
struct [[nodiscard]] For final
{
    ExpressionId              range;
    std::vector<ExpressionId> body;
};

using ExpressionKind = std::variant<Call, StringLiteral, Number, Variable, Constant, Range, For>;

struct [[nodiscard]] Expression final
{
    ExpressionKind kind;
    Span           span;
    ExpressionId   id;
};

struct [[nodiscard]] Statement final
{
    StatementKind kind;
    Span          span;
    std::size_t   id;
};

// Flat storage: expressions refer to their operands by id, statements to their root expression.
struct [[nodiscard]] Ast final
{
    std::vector<Statement>  statements;
    std::vector<Expression> expressions;

    [[nodiscard]] auto expression_by_id(const ExpressionId id) const -> const Expression& { return expressions[id]; }

    [[nodiscard]] auto expression_of(const Statement& statement) const -> const Expression&
    {
        return expression_by_id(std::get<ExpressionId>(statement.kind));
    }

    template<typename... Args>
    auto emplace_statement(Args&&... args) -> Statement&
    {
        return statements.emplace_back(std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto emplace_expression(Args&&... args) -> Expression&
    {
        return expressions.emplace_back(std::forward<Args>(args)...);
    }
};

// "#1, #2, #3"
[[nodiscard]] inline auto join_expression_ids(const std::vector<ExpressionId>& ids) -> std::string
{
    std::string result;
    for (const auto id : ids) {
        if (!result.empty()) { result += ", "; }
        result += std::format("#{}", id);
    }

    return result;
}

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::Statement>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Statement& statement, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{} statement -> #{}", statement.span, std::get<Interpreter::ExpressionId>(statement.kind)
        );
    }
};

template<>
struct std::formatter<Interpreter::ExpressionKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::ExpressionKind& kind, auto& ctx) const
    {
        static_assert(
          std::variant_size_v<Interpreter::ExpressionKind> == 7,
          "Exhaustive handling of all variants for ExpressionKind is required."
        );

        const auto visitor = Util::make_visitor(
          [](const Interpreter::Call& call) {
              return std::format(
                "call {}({})", call.identifier.lexeme, Interpreter::join_expression_ids(call.arguments)
              );
          },
          [](const Interpreter::StringLiteral& string) { return std::format("string \"{}\"", string.literal.lexeme); },
          [](const Interpreter::Number& number) { return std::format("number {}", number.number.lexeme); },
          [](const Interpreter::Variable& variable) { return std::format("variable {}", variable.name.lexeme); },
          [](const Interpreter::Constant& constant) {
              return std::format("constant {} :: #{}", constant.name.lexeme, constant.value);
          },
          [](const Interpreter::Range& range) {
              return std::format("range {}..{}", range.start.lexeme, range.end.lexeme);
          },
          [](const Interpreter::For& loop) {
              return std::format("for #{} {{ {} }}", loop.range, Interpreter::join_expression_ids(loop.body));
          }
        );

        return std::format_to(ctx.out(), "{}", std::visit(visitor, kind));
    }
};

template<>
struct std::formatter<Interpreter::Expression>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Expression& expression, auto& ctx) const
    {
        return std::format_to(ctx.out(), "{} {}", expression.span, expression.kind);
    }
};
