#include "jsontree/grammar.hpp"

#include <memory>
#include <sstream>

#include "grammar/convert.hpp"
#include "grammar/rules.hpp"

namespace jsontree::grammar {

namespace {

namespace pegtl = tao::pegtl;

template <typename Rule>
Parsed<std::unique_ptr<Node>> build_tree(pegtl::memory_input<>& in, const char* expected) {
  try {
    std::unique_ptr<Node> root = pegtl::parse_tree::parse<Rule, rules::selector, rules::action, rules::control>(in);
    if (!root) {
      return fail<std::unique_ptr<Node>>(ErrCode::UnexpectedToken, 0, std::string("expected ") + expected);
    }
    return ok(std::move(root));
  } catch (const rules::Failure& f) {
    return fail<std::unique_ptr<Node>>(f.err().code, f.err().pos, f.err().message, true);
  }
}

template <typename Rule>
Parsed<Value> parse_with(std::string_view text, const char* expected) {
  pegtl::memory_input<> in(text.data(), text.size(), "document");
  Parsed<std::unique_ptr<Node>> tree = build_tree<Rule>(in, expected);
  if (tree.is_error) {
    return forward_error<Value>(tree);
  }
  return ok(convert_node(*tree.value));
}

void render_node(std::ostringstream& out, const Node& n) {
  out << node_name(n) << "(" << n.begin().byte << "," << n.end().byte << ")";
  if (n.children.empty()) {
    return;
  }
  out << "[";
  for (std::size_t i = 0; i < n.children.size(); ++i) {
    if (i > 0) out << ",";
    render_node(out, *n.children[i]);
  }
  out << "]";
}

}  // namespace

const char* production_name(Production p) {
  switch (p) {
    case Production::Value:
      return "value";
    case Production::Null:
      return "null";
    case Production::Bool:
      return "bool";
    case Production::Number:
      return "number";
    case Production::String:
      return "string";
    case Production::Array:
      return "array";
    case Production::Object:
      return "object";
  }
  return "value";
}

Parsed<Value> parse_document(std::string_view text) {
  return parse_with<rules::document>(text, "a document");
}

Parsed<Value> parse_production(Production p, std::string_view text) {
  switch (p) {
    case Production::Value:
      return parse_with<rules::document>(text, production_name(p));
    case Production::Null:
      return parse_with<rules::production<rules::null_lit>>(text, production_name(p));
    case Production::Bool:
      return parse_with<rules::production<rules::bool_lit>>(text, production_name(p));
    case Production::Number:
      return parse_with<rules::production<rules::number>>(text, production_name(p));
    case Production::String:
      return parse_with<rules::production<rules::string_lit>>(text, production_name(p));
    case Production::Array:
      return parse_with<rules::production<rules::array>>(text, production_name(p));
    case Production::Object:
      return parse_with<rules::production<rules::object>>(text, production_name(p));
  }
  return parse_with<rules::document>(text, production_name(p));
}

Parsed<std::string> render_parse_tree(std::string_view text) {
  pegtl::memory_input<> in(text.data(), text.size(), "document");
  Parsed<std::unique_ptr<Node>> tree = build_tree<rules::document>(in, "a document");
  if (tree.is_error) {
    return forward_error<std::string>(tree);
  }
  std::ostringstream out;
  for (std::size_t i = 0; i < tree.value->children.size(); ++i) {
    if (i > 0) out << ",";
    render_node(out, *tree.value->children[i]);
  }
  return ok(out.str());
}

}  // namespace jsontree::grammar
