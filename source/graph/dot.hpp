#pragma once

#include <ostream>
#include <string>

#include <ast/expression.hpp>

/// Writes the tree below `root` as an undirected Graphviz graph. Nodes are
/// numbered breadth first starting at the root, operators are drawn as boxes.
auto write_dot(const expression& root, std::ostream& out) -> void;

[[nodiscard]] auto to_dot(const expression& root) -> std::string;
