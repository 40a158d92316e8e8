#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "jsontree/document_parser.hpp"
#include "jsontree/errors.hpp"
#include "jsontree/grammar.hpp"
#include "jsontree/value.hpp"
#include "jsontree_cli/options.hpp"

namespace {

std::string read_input(const std::string& file) {
  std::stringstream buf;
  if (file.empty()) {
    buf << std::cin.rdbuf();
    return buf.str();
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + file);
  }
  buf << in.rdbuf();
  return buf.str();
}

void print_error(const jsontree::Err& err, const std::string& text) {
  std::cout << "ERR " << jsontree::err_code_name(err.code) << "\n";
  std::cout << "MSG " << jsontree::describe(err, text) << "\n";
}

}  // namespace

// Exit codes: 0 parsed, 1 rejected document, 2 usage or I/O error.
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  try {
    const jsontree::cli_detail::CliOptions opts = jsontree::cli_detail::parse_cli_options(argc, argv);
    const std::string text = read_input(opts.file);

    if (opts.print_tree) {
      const jsontree::Parsed<std::string> tree = jsontree::grammar::render_parse_tree(text);
      if (tree.is_error) {
        print_error(tree.err, text);
        return 1;
      }
      std::cout << "OK " << tree.value << "\n";
      return 0;
    }

    const auto parser = jsontree::make_document_parser(opts.engine);
    const jsontree::Parsed<jsontree::Value> doc = parser->parse(text);
    if (doc.is_error) {
      print_error(doc.err, text);
      return 1;
    }
    std::cout << "OK " << jsontree::to_debug_string(doc.value) << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "jsontree_cli: " << e.what() << "\n";
    return 2;
  }
}
