#pragma once

#include <optional>
#include <string>

#include "condkit/value.h"

namespace condkit {

/// Converts a value to a double for numeric comparison.
/// MUST accept Int/Float and strings that parse as a number in full.
/// Returns nullopt for every other input; no side effects.
std::optional<double> to_number(const Value& v);

/// Renders a value in its canonical textual form.
/// MUST render Null as the empty string and return strings unchanged.
/// Inputs are any value; outputs are strings with no side effects.
std::string to_string(const Value& v);

/// Truthiness used by istrue/isfalse.
/// MUST treat Bool as itself, non-zero numbers as true and only "true" strings as true.
/// Inputs are any value; outputs are boolean with no side effects.
bool to_bool(const Value& v);

/// Reports emptiness for isempty/isnotempty.
/// MUST be true for Null and for zero-length strings, sequences and mappings.
/// Inputs are any value; outputs are boolean with no side effects.
bool is_empty(const Value& v);

/// Converts a value to an instant.
/// MUST try the string layouts in a fixed order and take the first match;
/// integers are Unix epoch seconds. Returns nullopt otherwise.
std::optional<Timestamp> to_time(const Value& v);

/// Parses one of the supported time layouts; see to_time.
std::optional<Timestamp> parse_time(const std::string& text);

/// Formats an instant as RFC 3339 in UTC; fractional seconds only when non-zero.
std::string format_time(Timestamp t);

/// Three-way comparison returning -1, 0 or 1.
/// MUST prefer numeric, then temporal, then string representation, using a
/// representation only when both sides coerce to it.
int compare_values(const Value& a, const Value& b);

/// Loose equality behind eq, neq, in and nin.
/// MUST try structural equality first, then numeric, then textual.
/// Inputs are two values; outputs are boolean with no side effects.
bool is_equal(const Value& a, const Value& b);

}  // namespace condkit
