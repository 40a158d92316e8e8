#pragma once

#include <string_view>

#include "jsontree/value.hpp"

namespace jsontree::detail {

// Converts an already recognised -?digits(.digits)? literal. Returns false
// when an integer does not fit int64 or a float overflows double. Float
// literals too small for a normal double become subnormal or zero. The whole
// literal must be consumed, so a process locale whose decimal point is not
// '.' rejects fractions instead of truncating them.
bool number_from_literal(std::string_view literal, Number& out);

}  // namespace jsontree::detail
