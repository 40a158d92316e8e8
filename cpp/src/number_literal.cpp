#include "number_literal.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

namespace jsontree::detail {

bool number_from_literal(std::string_view literal, Number& out) {
  if (literal.find('.') == std::string_view::npos) {
    std::int64_t v = 0;
    const auto res = std::from_chars(literal.data(), literal.data() + literal.size(), v);
    if (res.ec != std::errc() || res.ptr != literal.data() + literal.size()) {
      return false;
    }
    out = Number::from_int(v);
    return true;
  }

  const std::string buf(literal);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size()) {
    return false;
  }
  // ERANGE is also set for subnormal and zero results, which are still the
  // nearest double to the literal. Only overflow is unrepresentable.
  if (errno == ERANGE && std::isinf(v)) {
    return false;
  }
  out = Number::from_float(v);
  return true;
}

}  // namespace jsontree::detail
