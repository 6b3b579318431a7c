#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <fmt/ostream.h>
#include <lexer/location.hpp>

/// Deepest tree the parser builds, deeper input is rejected before it can
/// exhaust the stack of the recursive tree walks.
constexpr std::size_t max_expression_depth = 1000;

struct expression;
using expression_ptr = std::unique_ptr<const expression>;

enum class binary_operator : std::uint8_t
{
    conjunction,
    disjunction,
    implication,
    equivalence,
};

auto operator<<(std::ostream& ostream, binary_operator op) -> std::ostream&;

template<>
struct fmt::formatter<binary_operator> : ostream_formatter
{
};

struct boolean_literal final
{
    bool value {};
};

struct identifier final
{
    std::string value;
};

struct negation final
{
    expression_ptr right;
};

struct binary_expression final
{
    binary_operator op {};
    expression_ptr left;
    expression_ptr right;
};

/// A node of the syntax tree. Children are owned by their parent, nodes are
/// never modified once the parser built them.
struct expression final
{
    using node_type = std::variant<boolean_literal, identifier, negation, binary_expression>;

    expression(node_type val, location loc);

    ~expression() = default;
    expression(const expression&) = delete;
    expression(expression&&) = delete;
    auto operator=(const expression&) -> expression& = delete;
    auto operator=(expression&&) -> expression& = delete;

    /// Fully parenthesized rendering, e.g. `((~1) v 0)`.
    [[nodiscard]] auto string() const -> std::string;

    [[nodiscard]] auto loc() const { return l; }

    /// Number of nodes on the longest path from here down to a leaf, a leaf has height 1.
    [[nodiscard]] auto height() const { return h; }

    /// Structural equality, locations are not compared.
    auto operator==(const expression& other) const -> bool;

    node_type node;
    location l;
    std::size_t h {};
};

auto operator<<(std::ostream& ostream, const expression& expr) -> std::ostream&;

template<typename Node>
auto make_expression(Node&& node, location loc = {}) -> expression_ptr
{
    return std::make_unique<const expression>(std::forward<Node>(node), loc);
}
