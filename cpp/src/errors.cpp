#include "jsontree/errors.hpp"

#include <sstream>

namespace jsontree {

std::string describe(const Err& err, std::string_view text) {
  std::size_t line = 1;
  std::size_t column = 1;
  const std::size_t end = err.pos < text.size() ? err.pos : text.size();
  for (std::size_t i = 0; i < end; ++i) {
    if (text[i] == '\n') {
      line += 1;
      column = 1;
    } else {
      column += 1;
    }
  }
  std::ostringstream out;
  out << err_code_name(err.code) << " at line " << line << ", column " << column;
  if (!err.message.empty()) {
    out << ": " << err.message;
  }
  return out.str();
}

}  // namespace jsontree
