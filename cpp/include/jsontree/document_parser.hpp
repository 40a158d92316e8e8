#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "jsontree/errors.hpp"
#include "jsontree/value.hpp"

namespace jsontree {

enum class Engine {
  Combinator,
  Grammar,
};

// Parses one complete in-memory document into a Value tree. Implementations
// hold no per-parse state, so one instance may serve several threads.
class DocumentParser {
 public:
  virtual ~DocumentParser() = default;

  virtual Parsed<Value> parse(std::string_view text) const = 0;
  virtual Engine engine() const = 0;
};

class CombinatorParser : public DocumentParser {
 public:
  Parsed<Value> parse(std::string_view text) const override;
  Engine engine() const override { return Engine::Combinator; }
};

class GrammarParser : public DocumentParser {
 public:
  Parsed<Value> parse(std::string_view text) const override;
  Engine engine() const override { return Engine::Grammar; }
};

std::unique_ptr<DocumentParser> make_document_parser(Engine engine);

std::string engine_name(Engine engine);

// Throws std::runtime_error for an unknown name.
Engine parse_engine_name(const std::string& name);

}  // namespace jsontree
