#include "condkit/coerce.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "../util/string_util.h"

namespace condkit {

namespace {

/// Parses a whole string as a double.
/// MUST reject partial parses, leading whitespace and overflow to infinity.
std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  if (std::isspace(static_cast<unsigned char>(s.front()))) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  double out = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  if (errno == ERANGE && std::isinf(out)) return std::nullopt;
  return out;
}

/// Shortest representation that reads back to the same double; exponent form
/// only for very small or large magnitudes.
std::string format_float(double d) {
  if (std::isnan(d)) return "NaN";
  if (std::isinf(d)) return d > 0 ? "+Inf" : "-Inf";
  char buf[64];
  int precision = 0;
  for (; precision < 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*e", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  const char* exp_pos = std::strchr(buf, 'e');
  int exponent = exp_pos ? std::atoi(exp_pos + 1) : 0;
  if (exponent < -4 || exponent >= 6) {
    return buf;
  }
  int decimals = precision - exponent;
  if (decimals < 0) decimals = 0;
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
  return buf;
}

// Unix seconds representable as a nanosecond Timestamp.
constexpr int64_t kMaxEpochSeconds = INT64_MAX / 1000000000;

}  // namespace

/// Converts a value to a double for numeric comparison.
/// MUST accept only Int, Float and fully numeric strings.
/// Inputs are any value; outputs are nullopt when no number applies, with no side effects.
std::optional<double> to_number(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Int:
      return static_cast<double>(v.as_int());
    case Value::Kind::Float:
      return v.as_float();
    case Value::Kind::String:
      return parse_double(v.as_string());
    default:
      return std::nullopt;
  }
}

/// Renders the canonical text form used by textual operators.
/// MUST render mappings with sorted keys so output is deterministic.
/// Inputs are any value; outputs are strings with no side effects.
std::string to_string(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:
      return "";
    case Value::Kind::Bool:
      return v.as_bool() ? "true" : "false";
    case Value::Kind::Int:
      return std::to_string(v.as_int());
    case Value::Kind::Float:
      return format_float(v.as_float());
    case Value::Kind::String:
      return v.as_string();
    case Value::Kind::Time:
      return format_time(v.as_time());
    case Value::Kind::Sequence: {
      std::string out = "[";
      bool first = true;
      for (const auto& item : v.as_list()) {
        if (!first) out += ' ';
        first = false;
        out += to_string(item);
      }
      out += ']';
      return out;
    }
    case Value::Kind::Mapping: {
      std::string out = "map[";
      bool first = true;
      for (const auto& entry : v.as_map()) {
        if (!first) out += ' ';
        first = false;
        out += entry.first;
        out += ':';
        out += to_string(entry.second);
      }
      out += ']';
      return out;
    }
  }
  return "";
}

/// Reports emptiness for isempty/isnotempty.
/// MUST treat only Null and zero-length containers or strings as empty.
/// Inputs are any value; outputs are boolean with no side effects.
bool is_empty(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:
      return true;
    case Value::Kind::String:
      return v.as_string().empty();
    case Value::Kind::Sequence:
      return v.as_list().empty();
    case Value::Kind::Mapping:
      return v.as_map().empty();
    default:
      return false;
  }
}

/// Computes truthiness for istrue/isfalse.
/// MUST accept only the case-insensitive word "true" for strings.
/// Inputs are any value; outputs are boolean with no side effects.
bool to_bool(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Null:
      return false;
    case Value::Kind::Bool:
      return v.as_bool();
    case Value::Kind::String:
      return util::to_lower(v.as_string()) == "true";
    case Value::Kind::Int:
      return v.as_int() != 0;
    case Value::Kind::Float:
      return v.as_float() != 0;
    default:
      return !is_empty(v);
  }
}

/// Converts a value to an instant for temporal comparison.
/// MUST reject epoch seconds that overflow a nanosecond Timestamp.
/// Inputs are any value; outputs are nullopt when no instant applies.
std::optional<Timestamp> to_time(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Time:
      return v.as_time();
    case Value::Kind::String:
      return parse_time(v.as_string());
    case Value::Kind::Int: {
      int64_t secs = v.as_int();
      if (secs > kMaxEpochSeconds || secs < -kMaxEpochSeconds) return std::nullopt;
      return Timestamp(std::chrono::seconds(secs));
    }
    default:
      return std::nullopt;
  }
}

/// Orders two values: numeric first, then temporal, then textual.
/// MUST use a representation only when both sides coerce to it.
/// Inputs are two values; outputs are -1, 0 or 1 with no side effects.
int compare_values(const Value& a, const Value& b) {
  auto n1 = to_number(a);
  if (n1.has_value()) {
    auto n2 = to_number(b);
    if (n2.has_value()) {
      if (*n1 < *n2) return -1;
      if (*n1 > *n2) return 1;
      return 0;
    }
  }

  auto t1 = to_time(a);
  if (t1.has_value()) {
    auto t2 = to_time(b);
    if (t2.has_value()) {
      if (*t1 < *t2) return -1;
      if (*t1 > *t2) return 1;
      return 0;
    }
  }

  int cmp = to_string(a).compare(to_string(b));
  if (cmp < 0) return -1;
  if (cmp > 0) return 1;
  return 0;
}

/// Loose equality behind eq, neq, in and nin.
/// MUST treat Null as equal only to Null.
/// Inputs are two values; outputs are boolean with no side effects.
bool is_equal(const Value& a, const Value& b) {
  if (a.is_null() && b.is_null()) return true;
  if (a.is_null() || b.is_null()) return false;

  if (a.deep_equals(b)) return true;

  auto n1 = to_number(a);
  if (n1.has_value()) {
    auto n2 = to_number(b);
    if (n2.has_value()) return *n1 == *n2;
  }

  return to_string(a) == to_string(b);
}

}  // namespace condkit
