#pragma once

#include <string>

#include "jsontree/document_parser.hpp"

namespace jsontree::cli_detail {

struct CliOptions {
  Engine engine = Engine::Combinator;
  bool print_tree = false;
  std::string file;
};

CliOptions parse_cli_options(int argc, char** argv);

}  // namespace jsontree::cli_detail
