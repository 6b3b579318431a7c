#include <cstddef>
#include <deque>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "dot.hpp"

#include <ast/expression.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <overloaded.hpp>

namespace
{
struct dot_node
{
    std::string label;
    bool is_operator {};
    std::vector<const expression*> children;
};

auto describe(const expression& expr) -> dot_node
{
    return std::visit(
        overloaded {
            [](const boolean_literal& lit) { return dot_node {.label = lit.value ? "1" : "0"}; },
            [](const identifier& ident) { return dot_node {.label = ident.value}; },
            [](const negation& neg)
            { return dot_node {.label = "~", .is_operator = true, .children = {neg.right.get()}}; },
            [](const binary_expression& bin)
            {
                return dot_node {
                    .label = fmt::format("{}", bin.op),
                    .is_operator = true,
                    .children = {bin.left.get(), bin.right.get()},
                };
            },
        },
        expr.node);
}
}  // namespace

auto write_dot(const expression& root, std::ostream& out) -> void
{
    using edge = std::pair<std::size_t, std::size_t>;
    auto queue = std::deque<std::pair<std::size_t, const expression*>> {};
    auto edges = std::vector<edge> {};
    std::size_t next_id = 0;

    out << "graph G {\n";
    queue.emplace_back(next_id++, &root);
    while (!queue.empty()) {
        const auto [id, expr] = queue.front();
        queue.pop_front();
        const auto node = describe(*expr);
        fmt::print(out, "    {} [label=\"{}\"{}]\n", id, node.label, node.is_operator ? " shape=\"box\"" : "");
        for (const auto* child : node.children) {
            edges.emplace_back(id, next_id);
            queue.emplace_back(next_id++, child);
        }
    }
    for (const auto& [parent, child] : edges) {
        fmt::print(out, "    {} -- {}\n", parent, child);
    }
    out << "}\n";
}

auto to_dot(const expression& root) -> std::string
{
    auto strm = std::ostringstream {};
    write_dot(root, strm);
    return strm.str();
}
