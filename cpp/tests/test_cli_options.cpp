#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "jsontree/document_parser.hpp"
#include "jsontree_cli/options.hpp"

namespace {

using jsontree::Engine;
using jsontree::cli_detail::CliOptions;
using jsontree::cli_detail::parse_cli_options;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "jsontree_cli");
  std::vector<char*> argv;
  for (std::string& a : args) argv.push_back(&a[0]);
  return parse_cli_options(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args, const std::string& msg) {
  try {
    (void)parse(args);
  } catch (const std::runtime_error&) {
    return true;
  }
  return check(false, msg);
}

bool test_defaults() {
  const CliOptions opts = parse({});
  if (!check(opts.engine == Engine::Combinator, "default engine")) return false;
  return check(!opts.print_tree && opts.file.empty(), "default flags");
}

bool test_engine_and_file() {
  const CliOptions opts = parse({"--engine", "grammar", "--file", "doc.json", "--tree"});
  if (!check(opts.engine == Engine::Grammar, "--engine grammar")) return false;
  if (!check(opts.file == "doc.json", "--file")) return false;
  return check(opts.print_tree, "--tree");
}

bool test_bad_arguments() {
  if (!rejects({"--engine"}, "missing engine value")) return false;
  if (!rejects({"--engine", "gpu"}, "unknown engine")) return false;
  if (!rejects({"--file"}, "missing file value")) return false;
  if (!rejects({"--tree"}, "--tree without grammar engine")) return false;
  return rejects({"--verbose"}, "unknown argument");
}

bool test_engine_names_round_trip() {
  for (const Engine e : {Engine::Combinator, Engine::Grammar}) {
    if (!check(jsontree::parse_engine_name(jsontree::engine_name(e)) == e, "engine name")) return false;
    if (!check(jsontree::make_document_parser(e)->engine() == e, "factory engine")) return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_defaults()) return 1;
  if (!test_engine_and_file()) return 1;
  if (!test_bad_arguments()) return 1;
  if (!test_engine_names_round_trip()) return 1;
  std::cout << "jsontree_test_cli_options: OK\n";
  return 0;
}
