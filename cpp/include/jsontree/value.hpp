#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace jsontree {

enum class NumberTag : std::uint8_t {
  Int,
  Float,
};

struct Number {
  union {
    std::int64_t i;
    double f;
  };
  NumberTag tag = NumberTag::Int;

  static Number from_int(std::int64_t v) {
    Number out;
    out.i = v;
    out.tag = NumberTag::Int;
    return out;
  }

  static Number from_float(double v) {
    Number out;
    out.i = 0;
    out.tag = NumberTag::Float;
    out.f = v;
    return out;
  }

  Number() : i(0) {}
};

inline bool operator==(const Number& a, const Number& b) {
  if (a.tag != b.tag) return false;
  return a.tag == NumberTag::Int ? a.i == b.i : a.f == b.f;
}

inline bool operator!=(const Number& a, const Number& b) { return !(a == b); }

static_assert(std::is_trivially_copyable<Number>::value, "Number must be trivially copyable");
static_assert(sizeof(Number) <= 16, "Number should remain compact");

enum class ValueKind : std::uint8_t {
  Null,
  Bool,
  Number,
  String,
  Array,
  Object,
};

const char* value_kind_name(ValueKind kind);

class Value;

using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

// Immutable node of a parsed document. Containers own their children.
class Value {
 public:
  Value() = default;

  static Value null() { return Value{}; }
  static Value from_bool(bool v);
  static Value from_number(Number v);
  static Value from_int(std::int64_t v) { return from_number(Number::from_int(v)); }
  static Value from_float(double v) { return from_number(Number::from_float(v)); }
  static Value from_string(std::string v);
  static Value from_array(Array v);
  static Value from_object(Object v);

  ValueKind kind() const { return kind_; }
  bool is_null() const { return kind_ == ValueKind::Null; }

  // Payload accessors throw std::logic_error on a kind mismatch.
  bool as_bool() const;
  const Number& as_number() const;
  const std::string& as_string() const;
  const Array& as_array() const;
  const Object& as_object() const;

  // nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

 private:
  ValueKind kind_ = ValueKind::Null;
  bool bool_v_ = false;
  Number number_v_;
  std::string string_v_;
  Array array_v_;
  Object object_v_;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

std::string to_debug_string(const Value& v);

}  // namespace jsontree
