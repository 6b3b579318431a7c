#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <error/error.hpp>
#include <eval/environment.hpp>
#include <lexer/lexer.hpp>
#include <lexer/location.hpp>
#include <lexer/token.hpp>

class parser final
{
  public:
    /// Assignments seen while parsing are recorded in `env`.
    parser(lexer lxr, environment& env);
    auto parse_program() -> program_ptr;

    /// Empty on success. Parsing stops at the first lexical or syntax error,
    /// so at most one error is ever recorded.
    [[nodiscard]] auto errors() const -> const std::vector<error>&;

  private:
    using binary_parser = std::function<expression_ptr(expression_ptr)>;
    using unary_parser = std::function<expression_ptr()>;

    auto next_token() -> void;
    auto skip_newlines() -> void;
    auto parse_assignment(program& prgrm) -> bool;

    auto parse_expression(int precedence) -> expression_ptr;
    auto parse_identifier() const -> expression_ptr;
    auto parse_boolean() const -> expression_ptr;
    auto parse_negation() -> expression_ptr;
    auto parse_binary_expression(expression_ptr left, binary_operator op) -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;

    auto get(token_type type) -> bool;
    auto current_token_is(token_type type) const -> bool;
    auto peek_token_is(token_type type) const -> bool;
    auto peek_error(std::initializer_list<token_type> expected) -> void;
    auto unexpected_token_error(const token& found, std::initializer_list<token_type> expected) -> void;
    auto register_binary(token_type type, binary_parser binary) -> void;
    auto register_unary(token_type type, unary_parser unary) -> void;
    auto no_unary_expression_error(const token& found) -> void;
    auto peek_precedence() const -> int;
    auto current_precedence() const -> int;
    auto failed() const -> bool;
    auto check_depth(expression_ptr expr) -> expression_ptr;
    auto nesting_error(const token& found, location loc) -> void;

    template<typename E>
    auto new_error(E&& err) -> void
    {
        if (m_errors.empty()) {
            m_errors.emplace_back(std::forward<E>(err));
        }
    }

    lexer m_lxr;
    environment& m_env;
    token m_current_token {};
    token m_peek_token {};
    std::vector<error> m_errors {};
    std::size_t m_depth {};

    std::unordered_map<token_type, unary_parser> m_unary_parsers;
    std::unordered_map<token_type, binary_parser> m_binary_parsers;
};
