#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace jsontree {

enum class ErrCode {
  UnexpectedToken,
  UnterminatedLiteral,
  InvalidNumericLiteral,
  ExhaustedAlternatives,
};

inline const char* err_code_name(ErrCode code) {
  switch (code) {
    case ErrCode::UnexpectedToken:
      return "UnexpectedToken";
    case ErrCode::UnterminatedLiteral:
      return "UnterminatedLiteral";
    case ErrCode::InvalidNumericLiteral:
      return "InvalidNumericLiteral";
    case ErrCode::ExhaustedAlternatives:
      return "ExhaustedAlternatives";
  }
  return "UnexpectedToken";
}

// pos is a byte offset into the parsed text.
struct Err {
  ErrCode code;
  std::size_t pos = 0;
  std::string message;
};

// Result of one parser call. A fatal failure happened after the production
// committed past its opening delimiter and must not be retried as another
// alternative.
template <typename T>
struct Parsed {
  bool is_error = false;
  bool fatal = false;
  T value{};
  Err err{ErrCode::UnexpectedToken, 0, ""};
};

template <typename T>
Parsed<T> ok(T value) {
  Parsed<T> out;
  out.value = std::move(value);
  return out;
}

template <typename T>
Parsed<T> fail(ErrCode code, std::size_t pos, std::string message, bool fatal = false) {
  Parsed<T> out;
  out.is_error = true;
  out.fatal = fatal;
  out.err = Err{code, pos, std::move(message)};
  return out;
}

// Re-types a failure, e.g. a failed key parse surfacing from parse_object.
template <typename T, typename U>
Parsed<T> forward_error(const Parsed<U>& failed) {
  Parsed<T> out;
  out.is_error = true;
  out.fatal = failed.fatal;
  out.err = failed.err;
  return out;
}

// "<CodeName> at line L, column C: message", line and column 1-based.
std::string describe(const Err& err, std::string_view text);

}  // namespace jsontree
