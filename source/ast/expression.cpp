#include <algorithm>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "expression.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

auto operator<<(std::ostream& ostream, binary_operator op) -> std::ostream&
{
    using enum binary_operator;
    switch (op) {
        case conjunction:
            return ostream << "^";
        case disjunction:
            return ostream << "v";
        case implication:
            return ostream << "=>";
        case equivalence:
            return ostream << "<=>";
    }
    throw std::invalid_argument("invalid binary_operator");
}

namespace
{
auto height_of(const expression::node_type& node) -> std::size_t
{
    return std::visit(
        overloaded {
            [](const boolean_literal&) -> std::size_t { return 1; },
            [](const identifier&) -> std::size_t { return 1; },
            [](const negation& neg) -> std::size_t { return neg.right->height() + 1; },
            [](const binary_expression& bin) -> std::size_t
            { return std::max(bin.left->height(), bin.right->height()) + 1; },
        },
        node);
}
}  // namespace

expression::expression(node_type val, location loc)
    : node {std::move(val)}
    , l {loc}
    , h {height_of(node)}
{
}

auto expression::string() const -> std::string
{
    return std::visit(
        overloaded {
            [](const boolean_literal& lit) -> std::string { return lit.value ? "1" : "0"; },
            [](const identifier& ident) -> std::string { return ident.value; },
            [](const negation& neg) -> std::string { return fmt::format("(~{})", neg.right->string()); },
            [](const binary_expression& bin) -> std::string
            { return fmt::format("({} {} {})", bin.left->string(), bin.op, bin.right->string()); },
        },
        node);
}

auto expression::operator==(const expression& other) const -> bool
{
    return std::visit(
        overloaded {
            [](const boolean_literal& lhs, const boolean_literal& rhs) { return lhs.value == rhs.value; },
            [](const identifier& lhs, const identifier& rhs) { return lhs.value == rhs.value; },
            [](const negation& lhs, const negation& rhs) { return *lhs.right == *rhs.right; },
            [](const binary_expression& lhs, const binary_expression& rhs)
            { return lhs.op == rhs.op && *lhs.left == *rhs.left && *lhs.right == *rhs.right; },
            [](const auto& /*lhs*/, const auto& /*rhs*/) { return false; },
        },
        node,
        other.node);
}

auto operator<<(std::ostream& ostream, const expression& expr) -> std::ostream&
{
    return ostream << expr.string();
}
