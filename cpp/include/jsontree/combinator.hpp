#pragma once

#include <string>
#include <string_view>

#include "jsontree/cursor.hpp"
#include "jsontree/errors.hpp"
#include "jsontree/value.hpp"

// Hand-assembled parsers working directly on a Cursor. Every parser leaves
// the cursor where it was when it fails; only a fatal failure (one raised
// after a container or literal committed past its opening delimiter) stops
// the value dispatcher from trying the next production.
namespace jsontree::combinator {

Parsed<Value> parse_null(Cursor& in);
Parsed<bool> parse_bool(Cursor& in);

// -?[0-9]+(\.[0-9]+)? ; Float iff a fractional part is present.
// Exponents are not recognised and are left in the input.
Parsed<Number> parse_number(Cursor& in);

// Raw characters up to the next '"'. Backslashes are ordinary characters,
// so an escaped quote ends the string.
Parsed<std::string> parse_string(Cursor& in);

void skip_ws(Cursor& in);

// Whitespace, the delimiter, whitespace.
Parsed<char> expect_delimiter(Cursor& in, char delimiter);

Parsed<Array> parse_array(Cursor& in);

// At least one member is required; "{}" is rejected. A repeated key keeps
// the last value.
Parsed<Object> parse_object(Cursor& in);

// Tries null, bool, number, string, array, object in that order.
Parsed<Value> parse_value(Cursor& in);

// Whole-document entry point: surrounding whitespace is allowed, any other
// trailing content is an error.
Parsed<Value> parse_document(std::string_view text);

}  // namespace jsontree::combinator
