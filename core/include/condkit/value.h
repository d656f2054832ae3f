#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace condkit {

/// UTC instant with nanosecond resolution used for temporal comparisons.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

class Value;
using ValueList = std::vector<Value>;
using ValueMap = std::map<std::string, Value>;

/// Dynamically typed field or operand value.
/// MUST stay a closed sum type so every operator can be total over it.
/// Values are immutable; sequences and mappings are shared on copy.
class Value {
 public:
  enum class Kind { Null, Bool, Int, Float, String, Time, Sequence, Mapping };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool v) : data_(v) {}
  template <typename T,
            typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                        std::is_signed<T>::value,
                                    int>::type = 0>
  Value(T v) : data_(static_cast<int64_t>(v)) {}
  template <typename T,
            typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                        std::is_unsigned<T>::value,
                                    int>::type = 0>
  Value(T v) {
    // Unsigned values beyond int64 range degrade to Float.
    if (static_cast<uint64_t>(v) > static_cast<uint64_t>(INT64_MAX)) {
      data_ = static_cast<double>(v);
    } else {
      data_ = static_cast<int64_t>(v);
    }
  }
  Value(float v) : data_(static_cast<double>(v)) {}
  Value(double v) : data_(v) {}
  Value(const char* v) : data_(std::string(v ? v : "")) {}
  Value(std::string v) : data_(std::move(v)) {}
  Value(Timestamp v) : data_(v) {}
  Value(ValueList v) : data_(std::make_shared<const ValueList>(std::move(v))) {}
  Value(ValueMap v) : data_(std::make_shared<const ValueMap>(std::move(v))) {}

  /// Builds a sequence from an initializer list, e.g. `Value::list({20, 30})`.
  static Value list(std::initializer_list<Value> items);

  Kind kind() const;
  bool is_null() const { return kind() == Kind::Null; }

  bool as_bool() const { return std::get<bool>(data_); }
  int64_t as_int() const { return std::get<int64_t>(data_); }
  double as_float() const { return std::get<double>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  Timestamp as_time() const { return std::get<Timestamp>(data_); }
  /// Returns the sequence; MUST only be called when kind() is Sequence.
  const ValueList& as_list() const;
  /// Returns the mapping; MUST only be called when kind() is Mapping.
  const ValueMap& as_map() const;

  /// Structural equality: same kind and same contents, recursively.
  /// Performs no coercion (Int 1 and Float 1.0 are different here).
  bool deep_equals(const Value& other) const;

 private:
  using Storage = std::variant<std::monostate,
                               bool,
                               int64_t,
                               double,
                               std::string,
                               Timestamp,
                               std::shared_ptr<const ValueList>,
                               std::shared_ptr<const ValueMap>>;
  Storage data_;
};

/// Returns a lowercase name for a value kind ("null", "int", ...).
const char* kind_name(Value::Kind kind);

/// Key/value record evaluated by conditions. The engine never mutates it.
using DataRecord = std::unordered_map<std::string, Value>;

}  // namespace condkit
