#include "jsontree/document_parser.hpp"

#include <stdexcept>

#include "jsontree/combinator.hpp"
#include "jsontree/grammar.hpp"

namespace jsontree {

Parsed<Value> CombinatorParser::parse(std::string_view text) const {
  return combinator::parse_document(text);
}

Parsed<Value> GrammarParser::parse(std::string_view text) const {
  return grammar::parse_document(text);
}

std::unique_ptr<DocumentParser> make_document_parser(Engine engine) {
  switch (engine) {
    case Engine::Combinator:
      return std::make_unique<CombinatorParser>();
    case Engine::Grammar:
      return std::make_unique<GrammarParser>();
  }
  throw std::runtime_error("unknown engine");
}

std::string engine_name(Engine engine) {
  switch (engine) {
    case Engine::Combinator:
      return "combinator";
    case Engine::Grammar:
      return "grammar";
  }
  return "combinator";
}

Engine parse_engine_name(const std::string& name) {
  if (name == "combinator") return Engine::Combinator;
  if (name == "grammar") return Engine::Grammar;
  throw std::runtime_error("unknown engine: " + name);
}

}  // namespace jsontree
