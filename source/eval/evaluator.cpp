#include <stdexcept>
#include <variant>

#include "evaluator.hpp"

#include <ast/expression.hpp>
#include <error/error.hpp>
#include <overloaded.hpp>

#include "environment.hpp"

namespace
{
auto apply_binary_operator(binary_operator oper, bool left, bool right) -> bool
{
    using enum binary_operator;
    switch (oper) {
        case conjunction:
            return left && right;
        case disjunction:
            return left || right;
        case implication:
            return !left || right;
        case equivalence:
            return left == right;
    }
    throw std::invalid_argument("invalid binary_operator");
}

auto is_error(const eval_result& result) -> bool
{
    return std::holds_alternative<eval_error>(result);
}
}  // namespace

evaluator::evaluator(const environment& env)
    : m_env {env}
{
}

auto evaluator::evaluate(const expression& expr) const -> eval_result
{
    return std::visit(
        overloaded {
            [](const boolean_literal& lit) -> eval_result { return lit.value; },
            [this, &expr](const identifier& ident) -> eval_result
            {
                if (const auto value = m_env.get(ident.value); value.has_value()) {
                    return *value;
                }
                return eval_error {
                    .kind = eval_error::error_kind::unbound_variable,
                    .name = ident.value,
                    .loc = expr.loc(),
                };
            },
            [this](const negation& neg) -> eval_result
            {
                auto right = evaluate(*neg.right);
                if (is_error(right)) {
                    return right;
                }
                return !std::get<bool>(right);
            },
            [this](const binary_expression& bin) -> eval_result
            {
                auto left = evaluate(*bin.left);
                if (is_error(left)) {
                    return left;
                }
                auto right = evaluate(*bin.right);
                if (is_error(right)) {
                    return right;
                }
                return apply_binary_operator(bin.op, std::get<bool>(left), std::get<bool>(right));
            },
        },
        expr.node);
}
