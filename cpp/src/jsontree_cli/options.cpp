#include "options.hpp"

#include <stdexcept>

namespace jsontree::cli_detail {

CliOptions parse_cli_options(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--engine") {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for --engine");
      }
      opts.engine = parse_engine_name(argv[++i]);
      continue;
    }
    if (arg == "--file") {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for --file");
      }
      opts.file = argv[++i];
      if (opts.file.empty()) {
        throw std::runtime_error("invalid --file");
      }
      continue;
    }
    if (arg == "--tree") {
      opts.print_tree = true;
      continue;
    }
    throw std::runtime_error("unknown argument: " + arg);
  }
  if (opts.print_tree && opts.engine != Engine::Grammar) {
    throw std::runtime_error("--tree requires --engine grammar");
  }
  return opts;
}

}  // namespace jsontree::cli_detail
