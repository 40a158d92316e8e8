#include <iostream>
#include <string>

#include "jsontree/combinator.hpp"
#include "jsontree/cursor.hpp"
#include "jsontree/errors.hpp"
#include "jsontree/value.hpp"

namespace {

using jsontree::Cursor;
using jsontree::Err;
using jsontree::ErrCode;
using jsontree::Parsed;
using jsontree::Value;
namespace cb = jsontree::combinator;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

bool expect_err(const Parsed<Value>& out, ErrCode code, const std::string& msg) {
  if (!check(out.is_error, msg + " (expected error)")) return false;
  if (!check(out.err.code == code, msg + " (error code mismatch)")) return false;
  return check(out.value.is_null(), msg + " (partial tree surfaced)");
}

bool test_unrecognized_token() {
  const Parsed<Value> out = cb::parse_document("{invalid}");
  if (!expect_err(out, ErrCode::UnexpectedToken, "{invalid}")) return false;

  const Parsed<Value> word = cb::parse_document("undefined");
  if (!expect_err(word, ErrCode::ExhaustedAlternatives, "bare word")) return false;
  if (!check(word.err.message.find("expected null, bool, number") != std::string::npos,
             "exhausted alternatives names the attempted productions")) {
    return false;
  }
  return check(word.err.message.find("found 'u'") != std::string::npos, "exhausted alternatives names the byte");
}

bool test_exhausted_alternatives_at_end_of_input() {
  const Parsed<Value> out = cb::parse_document("   ");
  if (!expect_err(out, ErrCode::ExhaustedAlternatives, "blank document")) return false;
  if (!check(out.err.pos == 3, "blank document fails after the whitespace")) return false;
  return check(out.err.message.find("found end of input") != std::string::npos,
               "blank document reports end of input: " + out.err.message);
}

bool test_unterminated() {
  if (!expect_err(cb::parse_document("\"open"), ErrCode::UnterminatedLiteral, "open string")) return false;
  if (!expect_err(cb::parse_document("[1, [2, 3]"), ErrCode::UnterminatedLiteral, "open array")) return false;
  return expect_err(cb::parse_document("{\"a\": {\"b\": 1}"), ErrCode::UnterminatedLiteral, "open object");
}

bool test_invalid_numbers() {
  if (!expect_err(cb::parse_document("[1.]"), ErrCode::InvalidNumericLiteral, "missing fraction")) return false;
  if (!expect_err(cb::parse_document("{\"n\": -99999999999999999999}"), ErrCode::InvalidNumericLiteral,
                  "negative overflow")) {
    return false;
  }
  const std::string huge = "-1" + std::string(400, '0') + ".5";
  const Parsed<Value> out = cb::parse_document(huge);
  if (!expect_err(out, ErrCode::InvalidNumericLiteral, "float overflow")) return false;
  return check(out.fatal && out.err.pos == 0, "float overflow is fatal at the literal");
}

bool test_committed_container_does_not_backtrack() {
  Cursor in("[1, }");
  const Parsed<Value> out = cb::parse_value(in);
  if (!check(out.is_error && out.fatal, "failure inside an array is fatal")) return false;
  if (!check(out.err.code == ErrCode::ExhaustedAlternatives && out.err.pos == 4, "element failure position")) {
    return false;
  }
  return check(in.pos() == 0, "cursor restored after failed value");
}

bool test_failed_alternatives_restore_cursor() {
  Cursor in("  x");
  in.advance(2);
  const Parsed<Value> out = cb::parse_value(in);
  if (!check(out.is_error && !out.fatal, "no production matches 'x'")) return false;
  return check(in.pos() == 2, "dispatcher leaves cursor at the attempt position");
}

bool test_describe_line_and_column() {
  const std::string text = "{\n  \"a\": 1,\n  \"b\" 2\n}";
  const Parsed<Value> out = cb::parse_document(text);
  if (!expect_err(out, ErrCode::UnexpectedToken, "missing colon")) return false;
  const std::string d = jsontree::describe(out.err, text);
  if (!check(d.rfind("UnexpectedToken at line 3, column 7", 0) == 0, "describe line/column: " + d)) return false;

  const Err at_end{ErrCode::UnterminatedLiteral, 99, ""};
  return check(jsontree::describe(at_end, "ab") == "UnterminatedLiteral at line 1, column 3",
               "describe clamps past-the-end offsets");
}

}  // namespace

int main() {
  if (!test_unrecognized_token()) return 1;
  if (!test_exhausted_alternatives_at_end_of_input()) return 1;
  if (!test_unterminated()) return 1;
  if (!test_invalid_numbers()) return 1;
  if (!test_committed_container_does_not_backtrack()) return 1;
  if (!test_failed_alternatives_restore_cursor()) return 1;
  if (!test_describe_line_and_column()) return 1;
  std::cout << "jsontree_test_parse_errors: OK\n";
  return 0;
}
