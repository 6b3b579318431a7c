#pragma once

#include <variant>

#include <ast/expression.hpp>
#include <error/error.hpp>

#include "environment.hpp"

using eval_result = std::variant<bool, eval_error>;

class evaluator final
{
  public:
    explicit evaluator(const environment& env);

    /// Reduces `expr` to its truth value. Children are evaluated left before
    /// right, the first unbound identifier met stops the walk.
    [[nodiscard]] auto evaluate(const expression& expr) const -> eval_result;

  private:
    const environment& m_env;
};
