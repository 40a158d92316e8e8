#include "jsontree/value.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace jsontree {

namespace {

void require_kind(ValueKind have, ValueKind want) {
  if (have != want) {
    throw std::logic_error(std::string("value is ") + value_kind_name(have) + ", not " +
                           value_kind_name(want));
  }
}

void indent(std::ostringstream& out, int depth) {
  for (int i = 0; i < depth; ++i) out << "  ";
}

void write_number(std::ostringstream& out, const Number& n) {
  if (n.tag == NumberTag::Int) {
    out << "Int(" << n.i << ")";
    return;
  }
  out << "Float(" << std::setprecision(17) << n.f << ")";
}

void write_value(std::ostringstream& out, const Value& v, int depth) {
  switch (v.kind()) {
    case ValueKind::Null:
      out << "Null";
      return;
    case ValueKind::Bool:
      out << "Bool(" << (v.as_bool() ? "true" : "false") << ")";
      return;
    case ValueKind::Number:
      out << "Number(";
      write_number(out, v.as_number());
      out << ")";
      return;
    case ValueKind::String:
      out << "String(\"" << v.as_string() << "\")";
      return;
    case ValueKind::Array: {
      const Array& items = v.as_array();
      if (items.empty()) {
        out << "Array []";
        return;
      }
      out << "Array [\n";
      for (const Value& item : items) {
        indent(out, depth + 1);
        write_value(out, item, depth + 1);
        out << ",\n";
      }
      indent(out, depth);
      out << "]";
      return;
    }
    case ValueKind::Object: {
      const Object& members = v.as_object();
      if (members.empty()) {
        out << "Object {}";
        return;
      }
      out << "Object {\n";
      for (const auto& kv : members) {
        indent(out, depth + 1);
        out << "\"" << kv.first << "\": ";
        write_value(out, kv.second, depth + 1);
        out << ",\n";
      }
      indent(out, depth);
      out << "}";
      return;
    }
  }
}

}  // namespace

const char* value_kind_name(ValueKind kind) {
  switch (kind) {
    case ValueKind::Null:
      return "Null";
    case ValueKind::Bool:
      return "Bool";
    case ValueKind::Number:
      return "Number";
    case ValueKind::String:
      return "String";
    case ValueKind::Array:
      return "Array";
    case ValueKind::Object:
      return "Object";
  }
  return "Null";
}

Value Value::from_bool(bool v) {
  Value out;
  out.kind_ = ValueKind::Bool;
  out.bool_v_ = v;
  return out;
}

Value Value::from_number(Number v) {
  Value out;
  out.kind_ = ValueKind::Number;
  out.number_v_ = v;
  return out;
}

Value Value::from_string(std::string v) {
  Value out;
  out.kind_ = ValueKind::String;
  out.string_v_ = std::move(v);
  return out;
}

Value Value::from_array(Array v) {
  Value out;
  out.kind_ = ValueKind::Array;
  out.array_v_ = std::move(v);
  return out;
}

Value Value::from_object(Object v) {
  Value out;
  out.kind_ = ValueKind::Object;
  out.object_v_ = std::move(v);
  return out;
}

bool Value::as_bool() const {
  require_kind(kind_, ValueKind::Bool);
  return bool_v_;
}

const Number& Value::as_number() const {
  require_kind(kind_, ValueKind::Number);
  return number_v_;
}

const std::string& Value::as_string() const {
  require_kind(kind_, ValueKind::String);
  return string_v_;
}

const Array& Value::as_array() const {
  require_kind(kind_, ValueKind::Array);
  return array_v_;
}

const Object& Value::as_object() const {
  require_kind(kind_, ValueKind::Object);
  return object_v_;
}

const Value* Value::find(const std::string& key) const {
  if (kind_ != ValueKind::Object) {
    return nullptr;
  }
  auto it = object_v_.find(key);
  if (it == object_v_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool operator==(const Value& a, const Value& b) {
  if (a.kind() != b.kind()) {
    return false;
  }
  switch (a.kind()) {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Number:
      return a.as_number() == b.as_number();
    case ValueKind::String:
      return a.as_string() == b.as_string();
    case ValueKind::Array:
      return a.as_array() == b.as_array();
    case ValueKind::Object:
      return a.as_object() == b.as_object();
  }
  return false;
}

std::string to_debug_string(const Value& v) {
  std::ostringstream out;
  write_value(out, v, 0);
  return out.str();
}

}  // namespace jsontree
