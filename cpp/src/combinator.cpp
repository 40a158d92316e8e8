#include "jsontree/combinator.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

#include "number_literal.hpp"

namespace jsontree::combinator {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::size_t skip_digits(Cursor& in) {
  const std::size_t begin = in.pos();
  while (!in.at_end() && is_digit(in.peek())) in.advance();
  return in.pos() - begin;
}

bool match_word(Cursor& in, std::string_view word) {
  if (!in.starts_with(word)) {
    return false;
  }
  in.advance(word.size());
  return true;
}

std::string quoted(char c) { return std::string("'") + c + "'"; }

// A container element or key that failed where the grammar no longer allows
// backtracking. Running off the end of the input means the container was
// never closed.
template <typename T, typename U>
Parsed<T> commit_failure(const Cursor& in, const Parsed<U>& failed, ErrCode code, const std::string& what) {
  if (failed.fatal) {
    return forward_error<T>(failed);
  }
  if (failed.err.pos >= in.size()) {
    return fail<T>(ErrCode::UnterminatedLiteral, failed.err.pos, "unterminated " + what, true);
  }
  return fail<T>(code, failed.err.pos, failed.err.message, true);
}

Parsed<Value> parse_element(Cursor& in, const std::string& container) {
  Parsed<Value> item = parse_value(in);
  if (item.is_error) {
    return commit_failure<Value>(in, item, ErrCode::ExhaustedAlternatives, container);
  }
  return item;
}

}  // namespace

Parsed<Value> parse_null(Cursor& in) {
  if (!match_word(in, "null")) {
    return fail<Value>(ErrCode::UnexpectedToken, in.pos(), "expected 'null'");
  }
  return ok(Value::null());
}

Parsed<bool> parse_bool(Cursor& in) {
  if (match_word(in, "true")) return ok(true);
  if (match_word(in, "false")) return ok(false);
  return fail<bool>(ErrCode::UnexpectedToken, in.pos(), "expected 'true' or 'false'");
}

Parsed<Number> parse_number(Cursor& in) {
  const std::size_t start = in.pos();
  if (in.peek_is('-')) in.advance();
  if (skip_digits(in) == 0) {
    in.reset(start);
    return fail<Number>(ErrCode::UnexpectedToken, start, "expected a number");
  }

  if (in.peek_is('.')) {
    in.advance();
    const std::size_t frac_begin = in.pos();
    if (skip_digits(in) == 0) {
      in.reset(start);
      return fail<Number>(ErrCode::InvalidNumericLiteral, frac_begin, "expected digits after '.'", true);
    }
  }

  const std::string_view literal = in.slice(start, in.pos());
  Number out;
  if (!detail::number_from_literal(literal, out)) {
    in.reset(start);
    return fail<Number>(ErrCode::InvalidNumericLiteral, start,
                        "numeric literal out of range: " + std::string(literal), true);
  }
  return ok(out);
}

Parsed<std::string> parse_string(Cursor& in) {
  const std::size_t start = in.pos();
  if (!in.peek_is('"')) {
    return fail<std::string>(ErrCode::UnexpectedToken, start, "expected '\"'");
  }
  const std::size_t content = start + 1;
  const std::size_t close = in.text().find('"', content);
  if (close == std::string_view::npos) {
    return fail<std::string>(ErrCode::UnterminatedLiteral, in.size(),
                             "unterminated string opened at byte " + std::to_string(start), true);
  }
  in.reset(close + 1);
  return ok(std::string(in.slice(content, close)));
}

void skip_ws(Cursor& in) {
  while (!in.at_end() && std::isspace(static_cast<unsigned char>(in.peek()))) in.advance();
}

Parsed<char> expect_delimiter(Cursor& in, char delimiter) {
  const std::size_t start = in.pos();
  skip_ws(in);
  if (!in.peek_is(delimiter)) {
    const std::size_t at = in.pos();
    in.reset(start);
    return fail<char>(ErrCode::UnexpectedToken, at, "expected " + quoted(delimiter));
  }
  in.advance();
  skip_ws(in);
  return ok(delimiter);
}

Parsed<Array> parse_array(Cursor& in) {
  const std::size_t start = in.pos();
  Parsed<char> open = expect_delimiter(in, '[');
  if (open.is_error) {
    return forward_error<Array>(open);
  }

  Array items;
  if (!in.peek_is(']')) {
    do {
      Parsed<Value> item = parse_element(in, "array");
      if (item.is_error) {
        in.reset(start);
        return forward_error<Array>(item);
      }
      items.push_back(std::move(item.value));
    } while (!expect_delimiter(in, ',').is_error);
  }

  Parsed<char> close = expect_delimiter(in, ']');
  if (close.is_error) {
    in.reset(start);
    return commit_failure<Array>(in, close, ErrCode::UnexpectedToken, "array");
  }
  return ok(std::move(items));
}

Parsed<Object> parse_object(Cursor& in) {
  const std::size_t start = in.pos();
  Parsed<char> open = expect_delimiter(in, '{');
  if (open.is_error) {
    return forward_error<Object>(open);
  }

  Object members;
  do {
    Parsed<std::string> key = parse_string(in);
    if (key.is_error) {
      in.reset(start);
      return commit_failure<Object>(in, key, ErrCode::UnexpectedToken, "object");
    }
    Parsed<char> colon = expect_delimiter(in, ':');
    if (colon.is_error) {
      in.reset(start);
      return commit_failure<Object>(in, colon, ErrCode::UnexpectedToken, "object");
    }
    Parsed<Value> member = parse_element(in, "object");
    if (member.is_error) {
      in.reset(start);
      return forward_error<Object>(member);
    }
    members.insert_or_assign(std::move(key.value), std::move(member.value));
  } while (!expect_delimiter(in, ',').is_error);

  Parsed<char> close = expect_delimiter(in, '}');
  if (close.is_error) {
    in.reset(start);
    return commit_failure<Object>(in, close, ErrCode::UnexpectedToken, "object");
  }
  return ok(std::move(members));
}

Parsed<Value> parse_value(Cursor& in) {
  const std::size_t start = in.pos();
  auto note = [&](const auto&) { in.reset(start); };

  Parsed<Value> null_v = parse_null(in);
  if (!null_v.is_error) return null_v;
  note(null_v);

  Parsed<bool> bool_v = parse_bool(in);
  if (!bool_v.is_error) return ok(Value::from_bool(bool_v.value));
  note(bool_v);

  Parsed<Number> number_v = parse_number(in);
  if (!number_v.is_error) return ok(Value::from_number(number_v.value));
  if (number_v.fatal) return forward_error<Value>(number_v);
  note(number_v);

  Parsed<std::string> string_v = parse_string(in);
  if (!string_v.is_error) return ok(Value::from_string(std::move(string_v.value)));
  if (string_v.fatal) return forward_error<Value>(string_v);
  note(string_v);

  Parsed<Array> array_v = parse_array(in);
  if (!array_v.is_error) return ok(Value::from_array(std::move(array_v.value)));
  if (array_v.fatal) return forward_error<Value>(array_v);
  note(array_v);

  Parsed<Object> object_v = parse_object(in);
  if (!object_v.is_error) return ok(Value::from_object(std::move(object_v.value)));
  if (object_v.fatal) return forward_error<Value>(object_v);
  note(object_v);

  // Non-fatal failures all happen at start, so the offending byte is the
  // most specific thing to report.
  std::string message = "expected null, bool, number, string, array or object";
  message += in.at_end() ? std::string(", found end of input") : ", found " + quoted(in.peek());
  return fail<Value>(ErrCode::ExhaustedAlternatives, start, message);
}

Parsed<Value> parse_document(std::string_view text) {
  Cursor in(text);
  skip_ws(in);
  Parsed<Value> root = parse_value(in);
  if (root.is_error) {
    return root;
  }
  skip_ws(in);
  if (!in.at_end()) {
    return fail<Value>(ErrCode::UnexpectedToken, in.pos(), "trailing characters after document", true);
  }
  return root;
}

}  // namespace jsontree::combinator
