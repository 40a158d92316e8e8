#include "convert.hpp"

#include <stdexcept>
#include <utility>

#include "number_literal.hpp"
#include "rules.hpp"

namespace jsontree::grammar {

namespace {

const Node& only_child(const Node& n) {
  if (n.children.size() != 1) {
    throw std::logic_error("parse tree node '" + node_name(n) + "' must have exactly one child");
  }
  return *n.children.front();
}

}  // namespace

Value convert_node(const Node& n) {
  if (n.is_root() || n.is_type<rules::value>()) {
    return convert_node(only_child(n));
  }
  if (n.is_type<rules::null_lit>()) {
    return Value::null();
  }
  if (n.is_type<rules::bool_lit>()) {
    return Value::from_bool(n.string_view() == "true");
  }
  if (n.is_type<rules::number>()) {
    Number num;
    if (!detail::number_from_literal(n.string_view(), num)) {
      throw std::logic_error("number node was not range checked: " + n.string());
    }
    return Value::from_number(num);
  }
  if (n.is_type<rules::chars>()) {
    return Value::from_string(n.string());
  }
  if (n.is_type<rules::array>()) {
    Array items;
    items.reserve(n.children.size());
    for (const auto& child : n.children) {
      items.push_back(convert_node(*child));
    }
    return Value::from_array(std::move(items));
  }
  if (n.is_type<rules::object>()) {
    Object members;
    for (const auto& pair : n.children) {
      if (!pair->is_type<rules::member>() || pair->children.size() != 2) {
        throw std::logic_error("malformed object member in parse tree");
      }
      members.insert_or_assign(pair->children[0]->string(), convert_node(*pair->children[1]));
    }
    return Value::from_object(std::move(members));
  }
  throw std::logic_error("unhandled parse tree node: " + node_name(n));
}

std::string node_name(const Node& n) {
  if (n.is_root()) return "root";
  if (n.is_type<rules::value>()) return "value";
  if (n.is_type<rules::null_lit>()) return "null";
  if (n.is_type<rules::bool_lit>()) return "bool";
  if (n.is_type<rules::number>()) return "number";
  if (n.is_type<rules::chars>()) return "chars";
  if (n.is_type<rules::array>()) return "array";
  if (n.is_type<rules::object>()) return "object";
  if (n.is_type<rules::member>()) return "member";
  return std::string(n.type);
}

}  // namespace jsontree::grammar
