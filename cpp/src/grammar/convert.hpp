#pragma once

#include <string>

#include <tao/pegtl/contrib/parse_tree.hpp>

#include "jsontree/value.hpp"

namespace jsontree::grammar {

using Node = tao::pegtl::parse_tree::node;

// Builds the value tree for a node of an accepted parse tree. The root node
// and value nodes are unwrapped to their single child.
Value convert_node(const Node& n);

// Short rule name used when rendering a parse tree.
std::string node_name(const Node& n);

}  // namespace jsontree::grammar
