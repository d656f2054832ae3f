#include "condkit/value.h"

namespace condkit {

Value Value::list(std::initializer_list<Value> items) {
  return Value(ValueList(items));
}

Value::Kind Value::kind() const {
  switch (data_.index()) {
    case 0:
      return Kind::Null;
    case 1:
      return Kind::Bool;
    case 2:
      return Kind::Int;
    case 3:
      return Kind::Float;
    case 4:
      return Kind::String;
    case 5:
      return Kind::Time;
    case 6:
      return Kind::Sequence;
    default:
      return Kind::Mapping;
  }
}

const ValueList& Value::as_list() const {
  return *std::get<std::shared_ptr<const ValueList>>(data_);
}

const ValueMap& Value::as_map() const {
  return *std::get<std::shared_ptr<const ValueMap>>(data_);
}

/// Compares kind and contents recursively without coercion.
/// MUST compare mappings in key order and sequences element by element.
/// Inputs are two values; outputs are boolean with no side effects.
bool Value::deep_equals(const Value& other) const {
  Kind k = kind();
  if (k != other.kind()) return false;
  switch (k) {
    case Kind::Null:
      return true;
    case Kind::Bool:
      return as_bool() == other.as_bool();
    case Kind::Int:
      return as_int() == other.as_int();
    case Kind::Float:
      return as_float() == other.as_float();
    case Kind::String:
      return as_string() == other.as_string();
    case Kind::Time:
      return as_time() == other.as_time();
    case Kind::Sequence: {
      const auto& lhs = as_list();
      const auto& rhs = other.as_list();
      if (&lhs == &rhs) return true;
      if (lhs.size() != rhs.size()) return false;
      for (size_t i = 0; i < lhs.size(); ++i) {
        if (!lhs[i].deep_equals(rhs[i])) return false;
      }
      return true;
    }
    case Kind::Mapping: {
      const auto& lhs = as_map();
      const auto& rhs = other.as_map();
      if (&lhs == &rhs) return true;
      if (lhs.size() != rhs.size()) return false;
      auto it = rhs.begin();
      for (const auto& entry : lhs) {
        if (entry.first != it->first || !entry.second.deep_equals(it->second)) return false;
        ++it;
      }
      return true;
    }
  }
  return false;
}

const char* kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Null:
      return "null";
    case Value::Kind::Bool:
      return "bool";
    case Value::Kind::Int:
      return "int";
    case Value::Kind::Float:
      return "float";
    case Value::Kind::String:
      return "string";
    case Value::Kind::Time:
      return "time";
    case Value::Kind::Sequence:
      return "sequence";
    case Value::Kind::Mapping:
      return "mapping";
  }
  return "unknown";
}

}  // namespace condkit
