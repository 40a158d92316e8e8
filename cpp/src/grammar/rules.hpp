#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

#include "jsontree/errors.hpp"
#include "number_literal.hpp"

namespace jsontree::grammar::rules {

namespace pegtl = tao::pegtl;

// clang-format off
struct ws : pegtl::star<pegtl::space> {};

struct null_lit : pegtl::string<'n', 'u', 'l', 'l'> {};
struct true_lit : pegtl::string<'t', 'r', 'u', 'e'> {};
struct false_lit : pegtl::string<'f', 'a', 'l', 's', 'e'> {};
struct bool_lit : pegtl::sor<true_lit, false_lit> {};

struct digits : pegtl::plus<pegtl::digit> {};
struct fraction : pegtl::if_must<pegtl::one<'.'>, digits> {};
struct number : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, digits, pegtl::opt<fraction>> {};

// No escapes: the first '"' after the opening one closes the string.
struct chars : pegtl::star<pegtl::not_one<'"'>> {};
struct string_close : pegtl::one<'"'> {};
struct string_lit : pegtl::seq<pegtl::one<'"'>, chars, pegtl::must<string_close>> {};

struct value;

struct separator : pegtl::pad<pegtl::one<','>, pegtl::space> {};

struct array_element : pegtl::seq<value> {};
struct array_close : pegtl::one<']'> {};
struct array_elements : pegtl::seq<pegtl::must<array_element>,
                                   pegtl::star<pegtl::if_must<separator, array_element>>,
                                   ws, pegtl::must<array_close>> {};
struct array : pegtl::seq<ws, pegtl::one<'['>, ws, pegtl::sor<array_close, array_elements>> {};

struct key_value_separator : pegtl::one<':'> {};
struct member_value : pegtl::seq<value> {};
struct member : pegtl::seq<string_lit, ws, pegtl::must<key_value_separator>, ws, pegtl::must<member_value>> {};
struct object_close : pegtl::one<'}'> {};
struct object : pegtl::seq<ws, pegtl::one<'{'>, ws, pegtl::must<member>,
                           pegtl::star<pegtl::if_must<separator, member>>,
                           ws, pegtl::must<object_close>> {};

struct value : pegtl::sor<null_lit, bool_lit, number, string_lit, array, object> {};

struct document : pegtl::seq<ws, pegtl::must<value>, ws, pegtl::must<pegtl::eof>> {};

template <typename Rule>
struct production : pegtl::seq<Rule, pegtl::must<pegtl::eof>> {};
// clang-format on

template <typename Rule>
using selector = pegtl::parse_tree::selector<
    Rule, pegtl::parse_tree::store_content::on<value, null_lit, bool_lit, number, chars, array, object, member>>;

// Error reported when a must<Rule> commit point fails. Rules that close a
// container report UnterminatedLiteral when the input ran out instead.
template <typename Rule>
struct failure {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = false;
  static constexpr const char* message = "unexpected token";
};

template <>
struct failure<value> {
  static constexpr ErrCode code = ErrCode::ExhaustedAlternatives;
  static constexpr bool closes_container = false;
  static constexpr const char* message = "expected null, bool, number, string, array or object";
};

template <>
struct failure<pegtl::eof> {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = false;
  static constexpr const char* message = "trailing characters after document";
};

template <>
struct failure<digits> {
  static constexpr ErrCode code = ErrCode::InvalidNumericLiteral;
  static constexpr bool closes_container = false;
  static constexpr const char* message = "expected digits after '.'";
};

template <>
struct failure<string_close> {
  static constexpr ErrCode code = ErrCode::UnterminatedLiteral;
  static constexpr bool closes_container = false;
  static constexpr const char* message = "unterminated string";
};

template <>
struct failure<array_element> {
  static constexpr ErrCode code = ErrCode::ExhaustedAlternatives;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected an array element";
};

template <>
struct failure<array_close> {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected ']'";
};

template <>
struct failure<member> {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected a quoted key";
};

template <>
struct failure<key_value_separator> {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected ':'";
};

template <>
struct failure<member_value> {
  static constexpr ErrCode code = ErrCode::ExhaustedAlternatives;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected an object member value";
};

template <>
struct failure<object_close> {
  static constexpr ErrCode code = ErrCode::UnexpectedToken;
  static constexpr bool closes_container = true;
  static constexpr const char* message = "expected '}'";
};

class Failure : public std::runtime_error {
 public:
  explicit Failure(Err err) : std::runtime_error(err.message), err_(std::move(err)) {}
  const Err& err() const { return err_; }

 private:
  Err err_;
};

template <typename Rule>
struct control : pegtl::normal<Rule> {
  template <typename ParseInput, typename... States>
  [[noreturn]] static void raise(const ParseInput& in, States&&...) {
    ErrCode code = failure<Rule>::code;
    std::string message = failure<Rule>::message;
    if (failure<Rule>::closes_container && in.empty()) {
      code = ErrCode::UnterminatedLiteral;
      message = "unterminated container";
    }
    throw Failure(Err{code, in.position().byte, message});
  }
};

template <typename Rule>
struct action : pegtl::nothing<Rule> {};

// Range check happens while parsing so the tree walk never has to reject.
template <>
struct action<number> {
  template <typename ActionInput, typename... States>
  static void apply(const ActionInput& in, States&&...) {
    Number unused;
    if (!detail::number_from_literal(in.string_view(), unused)) {
      throw Failure(Err{ErrCode::InvalidNumericLiteral, in.position().byte,
                        "numeric literal out of range: " + in.string()});
    }
  }
};

}  // namespace jsontree::grammar::rules
