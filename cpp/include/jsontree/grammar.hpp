#pragma once

#include <string>
#include <string_view>

#include "jsontree/errors.hpp"
#include "jsontree/value.hpp"

// Declarative grammar front end. Recognition happens entirely in the
// generated parser; the resulting concrete parse tree is then walked into a
// Value tree.
namespace jsontree::grammar {

enum class Production {
  Value,
  Null,
  Bool,
  Number,
  String,
  Array,
  Object,
};

const char* production_name(Production p);

// Same acceptance rules and error codes as combinator::parse_document.
Parsed<Value> parse_document(std::string_view text);

// Matches one production against the whole text (no surrounding
// whitespace for the literal productions).
Parsed<Value> parse_production(Production p, std::string_view text);

// Renders the concrete parse tree as name(begin,end)[children...] with
// byte offsets, e.g. value(0,4)[null(0,4)].
Parsed<std::string> render_parse_tree(std::string_view text);

}  // namespace jsontree::grammar
