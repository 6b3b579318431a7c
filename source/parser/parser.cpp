#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <error/error.hpp>
#include <eval/environment.hpp>
#include <lexer/lexer.hpp>
#include <lexer/location.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    equivalence,
    implication,
    disjunction,
    conjunction,
    prefix,
};

class depth_guard final
{
  public:
    explicit depth_guard(std::size_t& depth)
        : m_depth {depth}
    {
        ++m_depth;
    }

    ~depth_guard() { --m_depth; }
    depth_guard(const depth_guard&) = delete;
    depth_guard(depth_guard&&) = delete;
    auto operator=(const depth_guard&) -> depth_guard& = delete;
    auto operator=(depth_guard&&) -> depth_guard& = delete;

  private:
    std::size_t& m_depth;
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::iff:
            return equivalence;
        case token_type::implies:
            return implication;
        case token_type::vee:
            return disjunction;
        case token_type::caret:
            return conjunction;
        default:
            return lowest;
    }
}
}  // namespace

parser::parser(lexer lxr, environment& env)
    : m_lxr(lxr)
    , m_env(env)
{
    next_token();
    next_token();
    using enum token_type;
    register_unary(ident, [this] { return parse_identifier(); });
    register_unary(zero, [this] { return parse_boolean(); });
    register_unary(one, [this] { return parse_boolean(); });
    register_unary(tilde, [this] { return parse_negation(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_binary(caret,
                    [this](expression_ptr left)
                    { return parse_binary_expression(std::move(left), binary_operator::conjunction); });
    register_binary(vee,
                    [this](expression_ptr left)
                    { return parse_binary_expression(std::move(left), binary_operator::disjunction); });
    register_binary(implies,
                    [this](expression_ptr left)
                    { return parse_binary_expression(std::move(left), binary_operator::implication); });
    register_binary(iff,
                    [this](expression_ptr left)
                    { return parse_binary_expression(std::move(left), binary_operator::equivalence); });
}

auto parser::parse_program() -> program_ptr
{
    using enum token_type;
    auto prgrm = std::make_unique<program>();
    skip_newlines();
    // assignments form a prefix, the first other line starts the expression
    while (!failed() && current_token_is(ident) && peek_token_is(assign)) {
        if (!parse_assignment(*prgrm)) {
            return {};
        }
        skip_newlines();
    }
    if (failed()) {
        return {};
    }
    if (current_token_is(eof)) {
        new_error(parse_error {
            .kind = parse_error::error_kind::empty_program,
            .found = eof,
            .loc = m_current_token.loc,
        });
        return {};
    }

    prgrm->expr = parse_expression(lowest);
    if (!prgrm->expr || failed()) {
        return {};
    }
    next_token();
    skip_newlines();
    if (!current_token_is(eof)) {
        unexpected_token_error(m_current_token, {eof});
        return {};
    }
    if (failed()) {
        return {};
    }
    return prgrm;
}

auto parser::errors() const -> const std::vector<error>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = m_peek_token;
    m_peek_token = m_lxr.next_token();
    if (m_peek_token.type == token_type::illegal) {
        new_error(lex_error {.loc = m_peek_token.loc, .unexpected = m_peek_token.literal.front()});
    }
}

auto parser::skip_newlines() -> void
{
    while (current_token_is(token_type::newline)) {
        next_token();
    }
}

auto parser::parse_assignment(program& prgrm) -> bool
{
    using enum token_type;
    auto assign_stmt = assignment {.name = std::string {m_current_token.literal}, .loc = m_current_token.loc};
    next_token();

    if (!peek_token_is(zero) && !peek_token_is(one)) {
        peek_error({zero, one});
        return false;
    }
    next_token();
    assign_stmt.value = current_token_is(one);

    if (!peek_token_is(newline) && !peek_token_is(eof)) {
        peek_error({newline, eof});
        return false;
    }
    if (!m_env.define(assign_stmt.name, assign_stmt.value)) {
        new_error(parse_error {
            .kind = parse_error::error_kind::duplicate_assignment,
            .found = ident,
            .name = assign_stmt.name,
            .loc = assign_stmt.loc,
        });
        return false;
    }
    prgrm.assignments.push_back(std::move(assign_stmt));
    next_token();
    return true;
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    if (m_depth >= max_expression_depth) {
        nesting_error(m_current_token, m_current_token.loc);
        return {};
    }
    const auto guard = depth_guard {m_depth};
    auto unary = m_unary_parsers[m_current_token.type];
    if (!unary) {
        no_unary_expression_error(m_current_token);
        return {};
    }
    auto left_expr = unary();
    while (left_expr && !failed() && precedence < peek_precedence()) {
        auto binary = m_binary_parsers[m_peek_token.type];
        if (!binary) {
            return left_expr;
        }
        next_token();

        left_expr = binary(std::move(left_expr));
    }
    return left_expr;
}

auto parser::parse_identifier() const -> expression_ptr
{
    return make_expression(identifier {std::string {m_current_token.literal}}, m_current_token.loc);
}

auto parser::parse_boolean() const -> expression_ptr
{
    return make_expression(boolean_literal {current_token_is(token_type::one)}, m_current_token.loc);
}

auto parser::parse_negation() -> expression_ptr
{
    const auto loc = m_current_token.loc;
    next_token();
    auto right = parse_expression(prefix);
    if (!right) {
        return {};
    }
    return check_depth(make_expression(negation {std::move(right)}, loc));
}

auto parser::parse_binary_expression(expression_ptr left, binary_operator op) -> expression_ptr
{
    const auto loc = m_current_token.loc;
    const auto precedence = current_precedence();
    next_token();
    auto right = parse_expression(precedence);
    if (!right) {
        return {};
    }
    return check_depth(
        make_expression(binary_expression {.op = op, .left = std::move(left), .right = std::move(right)}, loc));
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    next_token();
    auto exp = parse_expression(lowest);
    if (!exp || !get(token_type::rparen)) {
        return {};
    }
    return exp;
}

auto parser::get(token_type type) -> bool
{
    if (m_peek_token.type == type) {
        next_token();
        return true;
    }
    peek_error({type});
    return false;
}

auto parser::peek_error(std::initializer_list<token_type> expected) -> void
{
    unexpected_token_error(m_peek_token, expected);
}

auto parser::unexpected_token_error(const token& found, std::initializer_list<token_type> expected) -> void
{
    new_error(parse_error {
        .kind = parse_error::error_kind::unexpected_token,
        .expected = expected,
        .found = found.type,
        .loc = found.loc,
    });
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::no_unary_expression_error(const token& found) -> void
{
    using enum token_type;
    unexpected_token_error(found, {zero, one, ident, tilde, lparen});
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}

auto parser::failed() const -> bool
{
    return !m_errors.empty();
}

// long operator chains grow the tree without recursing in the parser, so the
// height is checked on every node built as well
auto parser::check_depth(expression_ptr expr) -> expression_ptr
{
    if (expr->height() > max_expression_depth) {
        nesting_error(m_current_token, expr->loc());
        return {};
    }
    return expr;
}

auto parser::nesting_error(const token& found, location loc) -> void
{
    new_error(parse_error {
        .kind = parse_error::error_kind::nesting_too_deep,
        .found = found.type,
        .loc = loc,
    });
}
