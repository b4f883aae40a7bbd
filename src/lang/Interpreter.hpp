#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "Lexer.hpp"
#include "Parser.hpp"
#include "simulations/Scheduler.hpp"
#include "Util.hpp"

namespace Interpreter
{

struct [[nodiscard]] Value final
{
    using ValueType = std::variant<std::string_view, double, std::monostate>;

    Value()
      : value { std::monostate {} }
    {}

    explicit Value(const std::string_view string)
      : value { string }
    {}

    explicit Value(const double number)
      : value { number }
    {}

    [[nodiscard]] constexpr auto is_string() const -> bool { return std::holds_alternative<std::string_view>(value); }

    [[nodiscard]] constexpr auto as_string() const -> std::string_view
    {
        return Util::get<std::string_view>(value).value();
    }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_string_or(Callback callback) const -> std::optional<std::string_view>
    {
        return is_string() ? as_string() : callback();
    }

    [[nodiscard]] constexpr auto is_number() const -> bool { return std::holds_alternative<double>(value); }

    [[nodiscard]] constexpr auto as_number() const -> double { return Util::get<double>(value).value(); }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_number_or(Callback callback) const -> std::optional<double>
    {
        return is_number() ? as_number() : callback();
    }

    [[nodiscard]] constexpr auto is_monostate() const -> bool { return std::holds_alternative<std::monostate>(value); }

  private:
    ValueType value;
};

// Evaluates a workload script into `Sim`, which must expose the fields and operations of
// Simulations::Workload.
template<typename Sim>
class [[nodiscard]] Interpreter final
{
  public:
    [[nodiscard]] static auto eval(const std::string_view file_content, const std::shared_ptr<Sim>& sim) -> bool
    {
        const auto tokens = Lexer::lex(file_content);
        if (!tokens) { return false; }

#ifdef DEBUG
        std::println("- Tokens -");
        for (std::size_t idx = 0; idx < tokens->size(); ++idx) { std::println("#{}: {}", idx, (*tokens)[idx]); }
#endif

        const auto ast = Parser::parse(*tokens);
        if (!ast) { return false; }

#ifdef DEBUG
        std::println("- Statements -");
        for (std::size_t idx = 0; idx < ast->statements.size(); ++idx) {
            std::println("#{}: {}", idx, ast->statements[idx]);
        }

        std::println("- Expressions -");
        for (std::size_t idx = 0; idx < ast->expressions.size(); ++idx) {
            std::println("#{}: {}", idx, ast->expressions[idx]);
        }
#endif

        Interpreter interpreter(sim, *ast);
        return interpreter.evaluate_ast();
    }

  private:
    // Upper bound on either end of a `for` range
    constexpr static auto MAX_RANGE_BOUND = 100'000UZ;

    [[nodiscard]] auto evaluate_ast() -> bool
    {
        for (const auto& statement : ast.statements) {
            if (!evaluate_statement(statement)) { return false; }
        }

        if (!check_burst_bounds(ast.statements.empty() ? Span {} : ast.statements.back().span)) { return false; }

        return true;
    }

    [[nodiscard]] auto evaluate_statement(const Statement& statement) -> std::optional<Value>
    {
        return evaluate_expression(ast.expression_of(statement));
    }

    [[nodiscard]] auto evaluate_expression(const Expression& expression) -> std::optional<Value>
    {
        static_assert(
          std::variant_size_v<ExpressionKind> == 7,
          "Exhaustive handling for all variants for ExpressionKind is required"
        );
        const auto call_expression_visitor = [&](const Call& call_expression) -> std::optional<Value> {
            const auto& [name, arguments] = call_expression;
            if (!is_builtin(name)) {
                report_error(name.span, "call to unknown function `{}`", name.lexeme);
                return report_note("available builtins are: spawn_process, spawn_random_process");
            }

            return builtin_handler(name, arguments);
        };

        const auto string_literal_visitor = [](const StringLiteral& string_literal) -> std::optional<Value> {
            return Value(string_literal.literal.lexeme);
        };

        const auto number_visitor = [](const Number& number) -> std::optional<Value> {
            const auto parsed_number = Util::parse_double(number.number.lexeme);
            if (!parsed_number) { return report_error(number.number.span, "invalid number `{}`", number.number.lexeme); }

            return Value(*parsed_number);
        };

        const auto variable_visitor = [](const Variable& variable) -> std::optional<Value> {
            return Value(variable.name.lexeme);
        };

        const auto constant_visitor = [this](const Constant& constant) -> std::optional<Value> {
            return evaluate_constant(constant);
        };

        const auto range_visitor = [](const Range&) -> std::optional<Value> { return Value(); };

        const auto for_visitor = [this](const For& four) -> std::optional<Value> {
            return evalute_for_expression(four);
        };

        const auto visitor = Util::make_visitor(
          call_expression_visitor,
          string_literal_visitor,
          number_visitor,
          variable_visitor,
          constant_visitor,
          range_visitor,
          for_visitor
        );

        return std::visit(visitor, expression.kind);
    }

    [[nodiscard]] auto evaluate_constant(const Constant& constant) -> std::optional<Value>
    {
        const auto& name  = constant.name;
        const auto  value = TRY(evaluate_expression(ast.expression_by_id(constant.value)));

        const auto expect_number = [&] {
            return value.as_number_or([&] -> std::optional<double> {
                return report_error(name.span, "mismatched type for constant `{}`: expected type `number`", name.lexeme);
            });
        };

        if (name.lexeme == "schedule_policy") {
            const auto policy_str = TRY(value.as_string_or([&] -> std::optional<std::string_view> {
                return report_error(name.span, "mismatched type for constant `{}`: expected a policy name", name.lexeme);
            }));

            const auto policy = Simulations::schedule_policy_try_from_str(policy_str);
            if (!policy) {
                report_error(name.span, "unknown schedule policy `{}`", policy_str);
                return report_note(
                  "available policies are: fcfs, sjf, srtf, priority, priority_preemptive, round_robin"
                );
            }
            sim->schedule_policy = *policy;
        } else if (name.lexeme == "time_quantum") {
            const auto quantum = TRY(expect_number());
            if (quantum <= 0.0) { return report_error(name.span, "time quantum must be positive, got {}", quantum); }
            sim->time_quantum = quantum;
        } else if (name.lexeme == "max_arrival_time") {
            sim->max_arrival_time = TRY(expect_number());
        } else if (name.lexeme == "min_burst_time") {
            const auto burst = TRY(expect_number());
            if (burst <= 0.0) { return report_error(name.span, "min_burst_time must be positive, got {}", burst); }
            sim->min_burst_time = burst;
        } else if (name.lexeme == "max_burst_time") {
            const auto burst = TRY(expect_number());
            if (burst <= 0.0) { return report_error(name.span, "max_burst_time must be positive, got {}", burst); }
            sim->max_burst_time = burst;
        } else if (name.lexeme == "max_priority") {
            const auto number   = TRY(expect_number());
            const auto priority = Util::to_integral<int>(number);
            if (!priority || *priority < 1) {
                return report_error(name.span, "max_priority must be a positive integer that fits an int, got {}", number);
            }
            sim->max_priority = *priority;
        } else if (name.lexeme == "seed") {
            const auto number = TRY(expect_number());
            const auto seed   = Util::to_integral<std::uint32_t>(number);
            if (!seed) { return report_error(name.span, "seed must be an integer in [0, {}], got {}", std::numeric_limits<std::uint32_t>::max(), number); }
            sim->reseed(*seed);
        } else {
            report_error(name.span, "invalid constant for current simulation: {}", name.lexeme);
            return report_note(
              "available constants are: schedule_policy, time_quantum, max_arrival_time, min_burst_time, "
              "max_burst_time, max_priority, seed"
            );
        }

        return Value();
    }

    [[nodiscard]] auto evalute_for_expression(const For& four) -> std::optional<Value>
    {
        const auto& range_expression = ast.expression_by_id(four.range);
        const auto  range            = TRY(Util::get<Range>(range_expression.kind));
        const auto  start            = TRY(range_bound(range.start));
        const auto  end              = TRY(range_bound(range.end));

        for (std::size_t i = start; i < end; ++i) {
            for (const auto& expr_id : four.body) { TRY(evaluate_expression(ast.expression_by_id(expr_id))); }
        }

        return Value();
    }

    [[nodiscard]] static auto range_bound(const Token& token) -> std::optional<std::size_t>
    {
        const auto number = Util::parse_double(token.lexeme);
        const auto bound  = number ? Util::to_integral<std::size_t>(*number) : std::nullopt;
        if (!bound) { return report_error(token.span, "range bounds must be integers, got `{}`", token.lexeme); }
        if (*bound > MAX_RANGE_BOUND) {
            return report_error(token.span, "range bound {} exceeds the maximum of {}", *bound, MAX_RANGE_BOUND);
        }

        return *bound;
    }

    [[nodiscard]] constexpr static auto is_builtin(const Token& token) -> bool
    {
        constexpr static std::string_view builtins[] = { "spawn_process", "spawn_random_process" };
        return std::ranges::contains(builtins, token.lexeme);
    }

    [[nodiscard]] auto spawn_process_builtin(const Token& callee, const std::vector<ExpressionId>& arguments)
      -> std::optional<Value>
    {
        constexpr static auto NAME     = "spawn_process";
        constexpr static auto MIN_ARGC = 3UZ;
        constexpr static auto MAX_ARGC = 4UZ;
        if (arguments.size() < MIN_ARGC || arguments.size() > MAX_ARGC) {
            report_function_call_mismatched_argc(callee, "3 or 4", arguments.size());
            return report_note("usage: {}(pid: string, arrival: number, burst: number[, priority: int])", NAME);
        }

        std::size_t argument_count = 0;
        const auto  next_argument  = [&] { return evaluate_expression(ast.expression_by_id(arguments[argument_count++])); };

        const auto pid_value = TRY(next_argument());
        const auto pid       = TRY(pid_value.as_string_or([&] -> std::optional<std::string_view> {
            return report_mismatched_argument(callee, argument_count - 1, "string");
        }));

        const auto arrival_value = TRY(next_argument());
        const auto arrival       = TRY(arrival_value.as_number_or([&] -> std::optional<double> {
            return report_mismatched_argument(callee, argument_count - 1, "number");
        }));

        const auto burst_value = TRY(next_argument());
        const auto burst       = TRY(burst_value.as_number_or([&] -> std::optional<double> {
            return report_mismatched_argument(callee, argument_count - 1, "number");
        }));

        std::optional<int> priority = std::nullopt;
        if (argument_count < arguments.size()) {
            const auto priority_value = TRY(next_argument());
            const auto number         = TRY(priority_value.as_number_or([&] -> std::optional<double> {
                return report_mismatched_argument(callee, argument_count - 1, "int");
            }));

            priority = Util::to_integral<int>(number);
            if (!priority) {
                return report_error(
                  callee.span, "priority of process `{}` must be an integer that fits an int, got {}", pid, number
                );
            }
        }

        if (pid.empty()) { return report_error(callee.span, "process id must not be empty"); }
        if (arrival < 0.0) {
            return report_error(callee.span, "arrival time of process `{}` must not be negative, got {}", pid, arrival);
        }
        if (burst <= 0.0) {
            return report_error(callee.span, "burst time of process `{}` must be positive, got {}", pid, burst);
        }
        if (sim->contains(pid)) { return report_error(callee.span, "process `{}` is already defined", pid); }

        sim->emplace_process(std::string(pid), arrival, burst, priority);

        return Value();
    }

    [[nodiscard]] auto spawn_random_process_builtin(const Token& callee, const std::vector<ExpressionId>& arguments)
      -> std::optional<Value>
    {
        if (!arguments.empty()) { return report_function_call_mismatched_argc(callee, "0", arguments.size()); }

        TRY(check_burst_bounds(callee.span));

        sim->emplace_random_process();

        return Value();
    }

    [[nodiscard]] auto check_burst_bounds(const Span& span) const -> std::optional<bool>
    {
        if (sim->min_burst_time > sim->max_burst_time) {
            return report_error(
              span,
              "min_burst_time ({}) must not be greater than max_burst_time ({})",
              sim->min_burst_time,
              sim->max_burst_time
            );
        }

        return true;
    }

    [[nodiscard]] auto builtin_handler(const Token& name, const std::vector<ExpressionId>& arguments)
      -> std::optional<Value>
    {
        if (name.lexeme == "spawn_process") { return spawn_process_builtin(name, arguments); }
        if (name.lexeme == "spawn_random_process") { return spawn_random_process_builtin(name, arguments); }

        assert(false && "unreachable");
        return Value();
    }

    static auto report_function_call_mismatched_argc(
      const Token&           callee,
      const std::string_view expected,
      const std::size_t      got
    ) -> std::nullopt_t
    {
        return report_error(
          callee.span,
          "failed to interpret call to builtin `{}`: expected {} arguments, {} were provided",
          callee.lexeme,
          expected,
          got
        );
    }

    static auto report_mismatched_argument(
      const Token&           callee,
      const std::size_t      argument_idx,
      const std::string_view expected
    ) -> std::nullopt_t
    {
        return report_error(
          callee.span,
          "mismatched type for argument #{} of builtin `{}`: expected type `{}`",
          argument_idx,
          callee.lexeme,
          expected
        );
    }

    template<typename... Args>
    static auto report_error(const Span& span, std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[ERROR] (interpreter) {}: {}", span, std::format(message, std::forward<Args>(args)...));
        return std::nullopt;
    }

    template<typename... Args>
    static auto report_note(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[NOTE] (interpreter) {}", std::format(message, std::forward<Args>(args)...));
        return std::nullopt;
    }

    explicit Interpreter(const std::shared_ptr<Sim>& sim, const Ast& ast)
      : sim { sim },
        ast { ast }
    {}

    std::shared_ptr<Sim> sim;
    const Ast&           ast;
};

} // namespace Interpreter
